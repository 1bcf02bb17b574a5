#ifndef FADER_H
#define FADER_H

#include "audio/fade_curve.h"
#include "core/error_codes.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace playout {

struct Passage;

// Fade regions of one passage on the file timeline (ticks).
struct FadeRegions {
    int64_t fadeInStartTicks = 0;
    int64_t fadeInEndTicks = 0;  // == start: no fade-in
    FadeCurve fadeInCurve = FadeCurve::Exponential;

    bool hasFadeOut = false;
    int64_t fadeOutStartTicks = 0;
    int64_t fadeOutEndTicks = 0;
    FadeCurve fadeOutCurve = FadeCurve::Logarithmic;
};

// Applies a passage's fade-in and fade-out curves to interleaved stereo
// buffers in place. The Fader keeps no position of its own: the caller owns
// the tick position and passes it to every apply() so the curve stays
// continuous across chunk boundaries.
class Fader {
   public:
    // sampleRate: rate of the buffers handed to apply() (the working rate)
    Fader(const FadeRegions& regions, uint32_t sampleRate);

    // Builds the regions from passage timing. discoveredEndTicks is used for
    // the fade-out end when the passage has no explicit end.
    static Fader forPassage(const Passage& passage, std::optional<int64_t> discoveredEndTicks,
                            uint32_t sampleRate);

    // Gain for the frame starting at tick. 1.0 outside every fade region.
    float multiplierAt(int64_t tick) const;

    // Multiplies each frame by multiplierAt(tickPosition) and advances
    // tickPosition by one frame's worth of ticks per frame.
    // Rejects odd sample counts with BUFFER_ODD_SAMPLE_COUNT (buffer and
    // tickPosition untouched).
    ErrorCode apply(float* samples, size_t sampleCount, int64_t& tickPosition) const;

    // True when neither region has any length.
    bool isPassThrough() const;

    int64_t ticksPerFrame() const {
        return ticksPerFrame_;
    }

    const FadeRegions& regions() const {
        return regions_;
    }

   private:
    FadeRegions regions_;
    int64_t ticksPerFrame_;
};

}  // namespace playout

#endif  // FADER_H
