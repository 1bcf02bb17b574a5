#include "audio/fader.h"

#include "core/timing.h"
#include "logging/logger.h"
#include "playback/passage.h"

#include <algorithm>

namespace playout {

Fader::Fader(const FadeRegions& regions, uint32_t sampleRate)
    : regions_(regions), ticksPerFrame_(timing::ticksPerSample(sampleRate)) {}

Fader Fader::forPassage(const Passage& passage, std::optional<int64_t> discoveredEndTicks,
                        uint32_t sampleRate) {
    const PassageTiming& t = passage.timing;

    FadeRegions regions;
    regions.fadeInStartTicks = t.startTicks;
    regions.fadeInEndTicks = std::max(t.startTicks, t.fadeInPointTicks);
    regions.fadeInCurve = passage.fadeInCurve;
    regions.fadeOutCurve = passage.fadeOutCurve;

    std::optional<int64_t> end = resolveEndTicks(t, discoveredEndTicks);
    if (t.fadeOutPointTicks && end && *t.fadeOutPointTicks < *end) {
        regions.hasFadeOut = true;
        regions.fadeOutStartTicks = *t.fadeOutPointTicks;
        regions.fadeOutEndTicks = *end;
    } else if (t.fadeOutPointTicks && !end) {
        LOG_WARN("Fader: fade-out point set but passage end unknown, fade-out disabled ({})",
                 passage.filePath);
    }

    LOG_DEBUG("Fader: fade-in {}ms ({}), fade-out {}ms ({})",
              timing::ticksToMs(regions.fadeInEndTicks - regions.fadeInStartTicks),
              fadeCurveToString(regions.fadeInCurve),
              regions.hasFadeOut
                  ? timing::ticksToMs(regions.fadeOutEndTicks - regions.fadeOutStartTicks)
                  : 0,
              fadeCurveToString(regions.fadeOutCurve));

    return Fader(regions, sampleRate);
}

float Fader::multiplierAt(int64_t tick) const {
    float gain = 1.0f;

    const int64_t inLength = regions_.fadeInEndTicks - regions_.fadeInStartTicks;
    if (inLength > 0 && tick < regions_.fadeInEndTicks) {
        const float x = static_cast<float>(static_cast<double>(tick - regions_.fadeInStartTicks) /
                                           static_cast<double>(inLength));
        gain *= fadeInGain(regions_.fadeInCurve, x);
    }

    if (regions_.hasFadeOut && tick >= regions_.fadeOutStartTicks) {
        const int64_t outLength = regions_.fadeOutEndTicks - regions_.fadeOutStartTicks;
        const float x =
            outLength > 0 ? static_cast<float>(static_cast<double>(tick - regions_.fadeOutStartTicks) /
                                               static_cast<double>(outLength))
                          : 1.0f;
        gain *= fadeOutGain(regions_.fadeOutCurve, x);
    }

    return gain;
}

ErrorCode Fader::apply(float* samples, size_t sampleCount, int64_t& tickPosition) const {
    if (sampleCount % 2 != 0) {
        return ErrorCode::BUFFER_ODD_SAMPLE_COUNT;
    }
    if (samples == nullptr || sampleCount == 0) {
        return ErrorCode::OK;
    }

    const size_t frames = sampleCount / 2;

    // Fast path: chunk lies entirely between the two regions.
    const int64_t chunkEnd = tickPosition + static_cast<int64_t>(frames) * ticksPerFrame_;
    const bool pastFadeIn = tickPosition >= regions_.fadeInEndTicks;
    const bool beforeFadeOut = !regions_.hasFadeOut || chunkEnd <= regions_.fadeOutStartTicks;
    if (pastFadeIn && beforeFadeOut) {
        tickPosition = chunkEnd;
        return ErrorCode::OK;
    }

    for (size_t frame = 0; frame < frames; ++frame) {
        const float gain = multiplierAt(tickPosition);
        samples[frame * 2] *= gain;
        samples[frame * 2 + 1] *= gain;
        tickPosition += ticksPerFrame_;
    }
    return ErrorCode::OK;
}

bool Fader::isPassThrough() const {
    return regions_.fadeInEndTicks <= regions_.fadeInStartTicks && !regions_.hasFadeOut;
}

}  // namespace playout
