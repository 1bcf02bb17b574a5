#include "playback/decoder_chain.h"

#include "logging/logger.h"

#include <algorithm>
#include <exception>

namespace playout {

const char* processStatusToString(ProcessStatus status) {
    switch (status) {
    case ProcessStatus::Processed:
        return "processed";
    case ProcessStatus::BufferFull:
        return "buffer_full";
    case ProcessStatus::Finished:
        return "finished";
    case ProcessStatus::Failed:
    default:
        return "failed";
    }
}

DecoderChain::DecoderChain(PassageId id, const Passage& passage, std::unique_ptr<Decoder> decoder,
                           std::shared_ptr<PlayoutRingBuffer> buffer, const EngineConfig& config)
    : id_(id),
      passage_(passage),
      decoder_(std::move(decoder)),
      buffer_(std::move(buffer)),
      fader_(Fader::forPassage(passage_,
                               decoder_ ? decoder_->discoveredEndTicks() : std::nullopt,
                               config.workingSampleRate)),
      marks_(Backpressure::computeMarks(buffer_ ? buffer_->capacity() : 0,
                                        config.playoutHeadroomFrames,
                                        config.resumeHysteresisFrames)),
      workingRate_(config.workingSampleRate),
      quality_(config.resamplerQuality),
      tickPosition_(passage_.timing.startTicks) {}

ProcessResult DecoderChain::advance() {
    try {
        return step();
    } catch (const std::exception& e) {
        // Decoder adapters may throw; the failure stays inside this chain.
        return fail(InnerError(ErrorCode::DECODE_FAILED,
                               std::string("Decoder threw: ") + e.what()));
    }
}

ProcessResult DecoderChain::step() {
    if (failed_) {
        ProcessResult result;
        result.status = ProcessStatus::Failed;
        result.totalFrames = totalPushed_;
        result.error = lastError_;
        return result;
    }
    if (finished_) {
        return finish(0);
    }
    if (!decoder_ || !buffer_) {
        return fail(InnerError(ErrorCode::INTERNAL_UNKNOWN, "Chain has no decoder or buffer"));
    }

    InnerError error;
    size_t pushed = 0;

    ProcessResult result;
    result.status = ProcessStatus::Processed;

    if (pendingFrames() > 0) {
        if (pushPending(pushed, error) != ErrorCode::OK) {
            return fail(error);
        }
        if (pendingFrames() > 0) {
            result.status = ProcessStatus::BufferFull;
        } else if (decoderDone_) {
            return finish(pushed);
        }
        result.framesPushed = pushed;
        result.totalFrames = totalPushed_;
        return result;
    }

    if (decoderDone_) {
        return finish(0);
    }

    // No room at all: do not decode into a chunk that cannot be pushed.
    if (Backpressure::writableFrames(buffer_->freeSpace(), marks_) == 0) {
        result.status = ProcessStatus::BufferFull;
        result.totalFrames = totalPushed_;
        return result;
    }

    DecodeStatus status = decoder_->decodeChunk(decoded_, error);
    switch (status) {
    case DecodeStatus::Failed:
        if (error.code == ErrorCode::OK) {
            error = InnerError(ErrorCode::DECODE_FAILED, "Decoder failed");
        }
        return fail(error);
    case DecodeStatus::EndOfStream:
        decoderDone_ = true;
        if (prepareTail(error) != ErrorCode::OK) {
            return fail(error);
        }
        break;
    case DecodeStatus::Chunk:
        if (prepare(decoded_, error) != ErrorCode::OK) {
            return fail(error);
        }
        break;
    }

    if (pushPending(pushed, error) != ErrorCode::OK) {
        return fail(error);
    }
    if (pendingFrames() > 0) {
        result.status = ProcessStatus::BufferFull;
    } else if (decoderDone_) {
        return finish(pushed);
    }
    result.framesPushed = pushed;
    result.totalFrames = totalPushed_;
    return result;
}

ErrorCode DecoderChain::prepare(const AudioChunk& chunk, InnerError& error) {
    if (chunk.samples.size() % 2 != 0) {
        error = InnerError(ErrorCode::BUFFER_ODD_SAMPLE_COUNT,
                           "Decoded chunk has odd sample count " +
                               std::to_string(chunk.samples.size()));
        return error.code;
    }
    if (!chunk.isValid()) {
        error = InnerError(ErrorCode::DECODE_INVALID_CHUNK, "Decoded chunk has no sample rate");
        return error.code;
    }

    if (!resampler_) {
        resampler_ = std::make_unique<Resampler>(chunk.sampleRate, workingRate_, quality_);
        if (resampler_->initialize(error) != ErrorCode::OK) {
            return error.code;
        }
    } else if (chunk.sampleRate != resampler_->inputRate()) {
        error = InnerError(ErrorCode::DECODE_INVALID_CHUNK,
                           "Sample rate changed mid-passage (" +
                               std::to_string(resampler_->inputRate()) + " -> " +
                               std::to_string(chunk.sampleRate) + ")");
        return error.code;
    }

    pendingOffset_ = 0;
    if (resampler_->process(chunk.samples.data(), chunk.samples.size(), pending_, error) !=
        ErrorCode::OK) {
        return error.code;
    }
    ErrorCode code = fader_.apply(pending_.data(), pending_.size(), tickPosition_);
    if (code != ErrorCode::OK) {
        error = InnerError(code, "Resampled chunk has odd sample count");
    }
    return code;
}

ErrorCode DecoderChain::prepareTail(InnerError& error) {
    pending_.clear();
    pendingOffset_ = 0;
    if (!resampler_) {
        return ErrorCode::OK;
    }
    if (resampler_->flush(pending_, error) != ErrorCode::OK) {
        return error.code;
    }
    ErrorCode code = fader_.apply(pending_.data(), pending_.size(), tickPosition_);
    if (code != ErrorCode::OK) {
        error = InnerError(code, "Resampler tail has odd sample count");
    }
    return code;
}

ErrorCode DecoderChain::pushPending(size_t& framesPushed, InnerError& error) {
    framesPushed = 0;
    const size_t writable = Backpressure::writableFrames(buffer_->freeSpace(), marks_);
    const size_t frames = std::min(pendingFrames(), writable);
    if (frames == 0) {
        return ErrorCode::OK;
    }

    PushResult pushResult = buffer_->push(pending_.data() + pendingOffset_ * 2, frames * 2);
    if (pushResult.error != ErrorCode::OK) {
        error = InnerError(pushResult.error, "Ring buffer rejected push");
        return error.code;
    }

    pendingOffset_ += pushResult.framesWritten;
    totalPushed_ += pushResult.framesWritten;
    framesPushed = pushResult.framesWritten;

    if (pendingOffset_ * 2 >= pending_.size()) {
        pending_.clear();
        pendingOffset_ = 0;
    }
    return ErrorCode::OK;
}

ProcessResult DecoderChain::finish(size_t framesPushed) {
    if (!finished_) {
        finished_ = true;
        buffer_->markFinished();
        decoder_.reset();
        resampler_.reset();
        LOG_DEBUG("Chain {}: decode finished, {} frames pushed", id_, totalPushed_);
    }

    ProcessResult result;
    result.status = ProcessStatus::Finished;
    result.framesPushed = framesPushed;
    result.totalFrames = totalPushed_;
    return result;
}

ProcessResult DecoderChain::fail(const InnerError& error) {
    if (!failed_) {
        failed_ = true;
        lastError_ = error;
        if (lastError_.cpp_code.empty()) {
            lastError_.cpp_code = errorCodeToHex(lastError_.code);
        }
        pending_.clear();
        pendingOffset_ = 0;
        decoder_.reset();
        resampler_.reset();
        LOG_ERROR("Chain {}: {} ({}) for {}", id_, errorCodeToString(lastError_.code),
                  lastError_.cpp_message, passage_.filePath);
    }

    ProcessResult result;
    result.status = ProcessStatus::Failed;
    result.totalFrames = totalPushed_;
    result.error = lastError_;
    return result;
}

}  // namespace playout
