#ifndef DECODER_H
#define DECODER_H

#include "core/error_codes.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace playout {

// Interleaved stereo float samples at sampleRate.
struct AudioChunk {
    std::vector<float> samples;
    uint32_t sampleRate = 0;

    size_t frames() const {
        return samples.size() / 2;
    }

    // Stereo chunks always carry whole frames.
    bool isValid() const {
        return sampleRate > 0 && samples.size() % 2 == 0;
    }

    void clear() {
        samples.clear();
    }
};

enum class DecodeStatus {
    Chunk,        // out holds the next chunk
    EndOfStream,  // no more audio; out is empty
    Failed        // error holds the cause
};

// Chunked decode contract consumed by a decoder chain.
//
// Each call returns the next slice of the passage (about one second) as
// interleaved stereo at the decoder's native rate. Calls after EndOfStream or
// Failed keep returning the same status.
class Decoder {
   public:
    virtual ~Decoder() = default;

    virtual DecodeStatus decodeChunk(AudioChunk& out, InnerError& error) = 0;

    // Passage end discovered from the source (file timeline, ticks), when the
    // decoder knows it.
    virtual std::optional<int64_t> discoveredEndTicks() const {
        return std::nullopt;
    }
};

}  // namespace playout

#endif  // DECODER_H
