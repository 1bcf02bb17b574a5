/**
 * @file fake_decoders.h
 * @brief In-memory decoders for chain, worker and engine tests.
 */

#pragma once

#include "audio/decoder.h"
#include "core/timing.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>

namespace playout {
namespace fakes {

// Constant stereo tone of a fixed length, handed out in fixed-size chunks.
// Left and right carry the same value unless rightAmplitude is set.
class ToneDecoder : public Decoder {
   public:
    ToneDecoder(uint32_t sampleRate, size_t totalFrames, size_t chunkFrames, float amplitude,
                bool reportEnd = true)
        : sampleRate_(sampleRate),
          totalFrames_(totalFrames),
          chunkFrames_(chunkFrames),
          left_(amplitude),
          right_(amplitude),
          reportEnd_(reportEnd) {}

    void setRightAmplitude(float amplitude) {
        right_ = amplitude;
    }

    DecodeStatus decodeChunk(AudioChunk& out, InnerError& error) override {
        (void)error;
        ++calls_;
        out.clear();
        out.sampleRate = sampleRate_;
        if (produced_ >= totalFrames_) {
            return DecodeStatus::EndOfStream;
        }
        const size_t frames = std::min(chunkFrames_, totalFrames_ - produced_);
        out.samples.resize(frames * 2);
        for (size_t i = 0; i < frames; ++i) {
            out.samples[i * 2] = left_;
            out.samples[i * 2 + 1] = right_;
        }
        produced_ += frames;
        return DecodeStatus::Chunk;
    }

    std::optional<int64_t> discoveredEndTicks() const override {
        if (!reportEnd_) {
            return std::nullopt;
        }
        return timing::samplesToTicks(totalFrames_, sampleRate_);
    }

    size_t calls() const {
        return calls_;
    }

   private:
    uint32_t sampleRate_;
    size_t totalFrames_;
    size_t chunkFrames_;
    float left_;
    float right_;
    bool reportEnd_;
    size_t produced_ = 0;
    size_t calls_ = 0;
};

// Ascending ramp: frame n carries the value n (both channels). Lets a test
// prove that frames arrive once and in order.
class RampDecoder : public Decoder {
   public:
    RampDecoder(uint32_t sampleRate, size_t totalFrames, size_t chunkFrames)
        : sampleRate_(sampleRate), totalFrames_(totalFrames), chunkFrames_(chunkFrames) {}

    DecodeStatus decodeChunk(AudioChunk& out, InnerError& error) override {
        (void)error;
        out.clear();
        out.sampleRate = sampleRate_;
        if (produced_ >= totalFrames_) {
            return DecodeStatus::EndOfStream;
        }
        const size_t frames = std::min(chunkFrames_, totalFrames_ - produced_);
        out.samples.resize(frames * 2);
        for (size_t i = 0; i < frames; ++i) {
            const float value = static_cast<float>(produced_ + i);
            out.samples[i * 2] = value;
            out.samples[i * 2 + 1] = value;
        }
        produced_ += frames;
        return DecodeStatus::Chunk;
    }

   private:
    uint32_t sampleRate_;
    size_t totalFrames_;
    size_t chunkFrames_;
    size_t produced_ = 0;
};

// Produces goodChunks chunks of a constant value, then fails (or throws).
class FailingDecoder : public Decoder {
   public:
    enum class Mode { Report, Throw };

    FailingDecoder(uint32_t sampleRate, size_t chunkFrames, size_t goodChunks,
                   Mode mode = Mode::Report, float amplitude = 0.25f)
        : sampleRate_(sampleRate),
          chunkFrames_(chunkFrames),
          goodChunks_(goodChunks),
          mode_(mode),
          amplitude_(amplitude) {}

    DecodeStatus decodeChunk(AudioChunk& out, InnerError& error) override {
        out.clear();
        out.sampleRate = sampleRate_;
        if (served_ < goodChunks_) {
            ++served_;
            out.samples.assign(chunkFrames_ * 2, amplitude_);
            return DecodeStatus::Chunk;
        }
        if (mode_ == Mode::Throw) {
            throw std::runtime_error("corrupt frame header");
        }
        error = InnerError(ErrorCode::IO_READ_FAILED, "simulated read failure");
        return DecodeStatus::Failed;
    }

   private:
    uint32_t sampleRate_;
    size_t chunkFrames_;
    size_t goodChunks_;
    Mode mode_;
    float amplitude_;
    size_t served_ = 0;
};

// Returns chunks whose sample rate changes after the first one.
class RateSwitchDecoder : public Decoder {
   public:
    DecodeStatus decodeChunk(AudioChunk& out, InnerError& error) override {
        (void)error;
        out.samples.assign(200, 0.1f);
        out.sampleRate = calls_++ == 0 ? 8000 : 16000;
        return DecodeStatus::Chunk;
    }

   private:
    int calls_ = 0;
};

}  // namespace fakes
}  // namespace playout
