#ifndef DECODER_CHAIN_H
#define DECODER_CHAIN_H

#include "audio/decoder.h"
#include "audio/fader.h"
#include "audio/resampler.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "io/playout_ring_buffer.h"
#include "playback/backpressure.h"
#include "playback/passage.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace playout {

enum class ProcessStatus {
    Processed,   // framesPushed frames went into the buffer
    BufferFull,  // buffer reached its headroom; not an error
    Finished,    // decode exhausted, buffer marked finished
    Failed       // error holds the cause; the chain is dead
};

const char* processStatusToString(ProcessStatus status);

struct ProcessResult {
    ProcessStatus status = ProcessStatus::Processed;
    size_t framesPushed = 0;  // this call
    uint64_t totalFrames = 0;  // over the chain's lifetime
    InnerError error;
};

/**
 * @brief decode -> resample -> fade -> push pipeline for one passage.
 *
 * All cross-chunk state lives here: the decoder cursor, the resampler filter
 * state, the fader tick position and the frames that did not fit into the
 * buffer on the previous call. Pending frames are pushed first on the next
 * advance(), so no frame is duplicated or skipped.
 *
 * Not thread-safe: only the decoder worker calls advance().
 */
class DecoderChain {
   public:
    DecoderChain(PassageId id, const Passage& passage, std::unique_ptr<Decoder> decoder,
                 std::shared_ptr<PlayoutRingBuffer> buffer, const EngineConfig& config);

    DecoderChain(const DecoderChain&) = delete;
    DecoderChain& operator=(const DecoderChain&) = delete;

    // Runs one step: flush pending frames or decode one chunk.
    ProcessResult advance();

    PassageId id() const {
        return id_;
    }

    const std::shared_ptr<PlayoutRingBuffer>& buffer() const {
        return buffer_;
    }

    const Backpressure::Marks& marks() const {
        return marks_;
    }

    // Fader position (file timeline ticks) of the next frame to be produced.
    int64_t tickPosition() const {
        return tickPosition_;
    }

    uint64_t totalFramesPushed() const {
        return totalPushed_;
    }

    size_t pendingFrames() const {
        return (pending_.size() / 2) - pendingOffset_;
    }

    bool isFinished() const {
        return finished_;
    }

    bool isFailed() const {
        return failed_;
    }

   private:
    ProcessResult step();
    ProcessResult fail(const InnerError& error);
    ProcessResult finish(size_t framesPushed);

    // Resample + fade a native chunk into pending_.
    ErrorCode prepare(const AudioChunk& chunk, InnerError& error);
    ErrorCode prepareTail(InnerError& error);

    // Pushes as much of pending_ as the headroom allows.
    ErrorCode pushPending(size_t& framesPushed, InnerError& error);

    PassageId id_;
    Passage passage_;
    std::unique_ptr<Decoder> decoder_;
    std::shared_ptr<PlayoutRingBuffer> buffer_;
    std::unique_ptr<Resampler> resampler_;
    Fader fader_;
    Backpressure::Marks marks_;

    uint32_t workingRate_;
    ResamplerQuality quality_;

    int64_t tickPosition_;
    uint64_t totalPushed_ = 0;

    AudioChunk decoded_;
    std::vector<float> pending_;
    size_t pendingOffset_ = 0;  // frames of pending_ already pushed

    bool decoderDone_ = false;
    bool finished_ = false;
    bool failed_ = false;
    InnerError lastError_;
};

}  // namespace playout

#endif  // DECODER_CHAIN_H
