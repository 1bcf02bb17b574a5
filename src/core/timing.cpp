#include "core/timing.h"

#include <array>
#include <cmath>
#include <utility>

namespace playout {
namespace timing {

namespace {

const std::array<std::pair<uint32_t, int64_t>, 11> kTicksPerSampleTable = {{
    {8000, 3528},
    {11025, 2560},
    {16000, 1764},
    {22050, 1280},
    {32000, 882},
    {44100, 640},
    {48000, 588},
    {88200, 320},
    {96000, 294},
    {176400, 160},
    {192000, 147},
}};

}  // namespace

int64_t msToTicks(int64_t milliseconds) {
    return milliseconds * TICKS_PER_MS;
}

int64_t ticksToMs(int64_t ticks) {
    return ticks / TICKS_PER_MS;
}

double ticksToSeconds(int64_t ticks) {
    return static_cast<double>(ticks) / static_cast<double>(TICK_RATE);
}

int64_t secondsToTicks(double seconds) {
    return static_cast<int64_t>(std::llround(seconds * static_cast<double>(TICK_RATE)));
}

int64_t ticksPerSample(uint32_t sampleRate) {
    if (sampleRate == 0) {
        return 0;
    }
    for (const auto& entry : kTicksPerSampleTable) {
        if (entry.first == sampleRate) {
            return entry.second;
        }
    }
    return TICK_RATE / static_cast<int64_t>(sampleRate);
}

size_t ticksToSamples(int64_t ticks, uint32_t sampleRate) {
    if (ticks <= 0 || sampleRate == 0) {
        return 0;
    }
    // ticks * rate can overflow for multi-hour positions at 192k; split the
    // division to keep the intermediate inside int64.
    const int64_t rate = static_cast<int64_t>(sampleRate);
    const int64_t whole = ticks / TICK_RATE;
    const int64_t rest = ticks % TICK_RATE;
    return static_cast<size_t>(whole * rate + (rest * rate) / TICK_RATE);
}

size_t ticksToSamplesCeil(int64_t ticks, uint32_t sampleRate) {
    if (ticks <= 0 || sampleRate == 0) {
        return 0;
    }
    const size_t frames = ticksToSamples(ticks, sampleRate);
    return samplesToTicks(frames, sampleRate) < ticks ? frames + 1 : frames;
}

int64_t samplesToTicks(size_t samples, uint32_t sampleRate) {
    return static_cast<int64_t>(samples) * ticksPerSample(sampleRate);
}

bool isSupportedSampleRate(uint32_t sampleRate) {
    if (sampleRate < MIN_SAMPLE_RATE || sampleRate > MAX_SAMPLE_RATE) {
        return false;
    }
    return TICK_RATE % static_cast<int64_t>(sampleRate) == 0;
}

}  // namespace timing
}  // namespace playout
