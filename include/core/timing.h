#ifndef PLAYOUT_TIMING_H
#define PLAYOUT_TIMING_H

#include <cstddef>
#include <cstdint>

// Fixed-point time domain shared by every playback component.
//
// One tick is 1/28,224,000 second. 28,224,000 is a common multiple of every
// supported sample rate, so a sample boundary never lands on a fractional
// tick and positions accumulated frame by frame do not drift.

namespace playout {
namespace timing {

constexpr int64_t TICK_RATE = 28224000;
constexpr int64_t TICKS_PER_MS = 28224;

constexpr uint32_t MIN_SAMPLE_RATE = 8000;
constexpr uint32_t MAX_SAMPLE_RATE = 192000;

int64_t msToTicks(int64_t milliseconds);
int64_t ticksToMs(int64_t ticks);

double ticksToSeconds(int64_t ticks);
int64_t secondsToTicks(double seconds);

// Ticks covered by one sample frame at sampleRate. sampleRate must be > 0.
int64_t ticksPerSample(uint32_t sampleRate);

// Whole frames contained in ticks (floor). Negative ticks yield 0.
size_t ticksToSamples(int64_t ticks, uint32_t sampleRate);

// Index of the first frame starting at or after ticks (ceiling).
size_t ticksToSamplesCeil(int64_t ticks, uint32_t sampleRate);

int64_t samplesToTicks(size_t samples, uint32_t sampleRate);

// True when sampleRate divides TICK_RATE and lies in [MIN, MAX].
bool isSupportedSampleRate(uint32_t sampleRate);

}  // namespace timing
}  // namespace playout

#endif  // PLAYOUT_TIMING_H
