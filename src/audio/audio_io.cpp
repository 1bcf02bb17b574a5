#include "audio/audio_io.h"

#include "core/timing.h"
#include "logging/logger.h"

#include <algorithm>
#include <cstring>

namespace playout {

namespace {

InnerError sndfileError(ErrorCode code, const std::string& message, SNDFILE* file) {
    InnerError error(code, message);
    error.sndfile_errno = sf_error(file);
    error.cpp_message += ": ";
    error.cpp_message += sf_strerror(file);
    return error;
}

}  // namespace

// SndfileDecoder implementation
SndfileDecoder::SndfileDecoder(const std::string& filename, int64_t startTicks,
                               std::optional<int64_t> endTicks, uint32_t chunkMs)
    : filename_(filename),
      startTicks_(startTicks),
      endTicks_(endTicks),
      chunkMs_(chunkMs),
      file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

SndfileDecoder::~SndfileDecoder() {
    close();
}

bool SndfileDecoder::open(InnerError& error) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    finished_ = false;
    failed_ = false;

    file_ = sf_open(filename_.c_str(), SFM_READ, &info_);
    if (!file_) {
        error = sndfileError(ErrorCode::IO_OPEN_FAILED, "Cannot open " + filename_, nullptr);
        LOG_ERROR("Decoder: {}", error.cpp_message);
        return false;
    }
    if (info_.samplerate <= 0 || info_.channels <= 0) {
        error = InnerError(ErrorCode::DECODE_UNSUPPORTED_FORMAT,
                           "Unsupported stream layout in " + filename_);
        close();
        return false;
    }

    const uint32_t rate = static_cast<uint32_t>(info_.samplerate);
    const sf_count_t startFrame =
        static_cast<sf_count_t>(timing::ticksToSamples(startTicks_, rate));
    endFrame_ = info_.frames;
    if (endTicks_) {
        endFrame_ = std::min<sf_count_t>(
            info_.frames, static_cast<sf_count_t>(timing::ticksToSamples(*endTicks_, rate)));
    }

    if (startFrame >= info_.frames) {
        // Start beyond the file: nothing to play
        position_ = info_.frames;
    } else if (startFrame > 0) {
        if (sf_seek(file_, startFrame, SEEK_SET) < 0) {
            error = sndfileError(ErrorCode::IO_SEEK_FAILED, "Seek failed in " + filename_, file_);
            close();
            return false;
        }
        position_ = startFrame;
    } else {
        position_ = 0;
    }

    LOG_DEBUG("Decoder: opened {} ({} Hz, {} ch, {} frames, passage frames [{}, {}))", filename_,
              info_.samplerate, info_.channels, info_.frames, position_, endFrame_);
    return true;
}

void SndfileDecoder::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

DecodeStatus SndfileDecoder::decodeChunk(AudioChunk& out, InnerError& error) {
    out.clear();
    if (failed_) {
        error = lastError_;
        return DecodeStatus::Failed;
    }
    if (finished_) {
        return DecodeStatus::EndOfStream;
    }
    if (!file_) {
        error = InnerError(ErrorCode::IO_READ_FAILED, "File not opened: " + filename_);
        return DecodeStatus::Failed;
    }
    if (position_ >= endFrame_) {
        finished_ = true;
        close();
        return DecodeStatus::EndOfStream;
    }

    const sf_count_t chunkFrames = std::max<sf_count_t>(
        1, static_cast<sf_count_t>(info_.samplerate) * chunkMs_ / 1000);
    const sf_count_t toRead = std::min(chunkFrames, endFrame_ - position_);
    const int channels = info_.channels;

    readBuffer_.resize(static_cast<size_t>(toRead) * channels);
    const sf_count_t framesRead = sf_readf_float(file_, readBuffer_.data(), toRead);
    if (framesRead <= 0) {
        if (sf_error(file_) != SF_ERR_NO_ERROR) {
            lastError_ = sndfileError(ErrorCode::IO_READ_FAILED, "Read failed in " + filename_, file_);
            failed_ = true;
            error = lastError_;
            close();
            return DecodeStatus::Failed;
        }
        // Header promised more frames than the file holds
        LOG_WARN("Decoder: {} ended early at frame {}", filename_, position_);
        finished_ = true;
        close();
        return DecodeStatus::EndOfStream;
    }

    const size_t frames = static_cast<size_t>(framesRead);
    out.sampleRate = static_cast<uint32_t>(info_.samplerate);
    out.samples.resize(frames * 2);
    if (channels == 1) {
        Utils::monoToStereo(readBuffer_.data(), out.samples.data(), frames);
    } else if (channels == 2) {
        std::memcpy(out.samples.data(), readBuffer_.data(), frames * 2 * sizeof(float));
    } else {
        Utils::firstTwoChannels(readBuffer_.data(), channels, out.samples.data(), frames);
    }

    position_ += framesRead;
    if (framesRead < toRead) {
        endFrame_ = position_;
    }
    return DecodeStatus::Chunk;
}

std::optional<int64_t> SndfileDecoder::discoveredEndTicks() const {
    if (info_.samplerate <= 0) {
        return std::nullopt;
    }
    return timing::samplesToTicks(static_cast<size_t>(info_.frames),
                                  static_cast<uint32_t>(info_.samplerate));
}

// WavWriter implementation
WavWriter::WavWriter() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::string& filename, int sampleRate, int channels) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    info_.samplerate = sampleRate;
    info_.channels = channels;
    info_.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;
    framesWritten_ = 0;

    file_ = sf_open(filename.c_str(), SFM_WRITE, &info_);
    if (!file_) {
        LOG_ERROR("Error opening output file: {}", filename);
        LOG_ERROR("libsndfile error: {}", sf_strerror(nullptr));
        return false;
    }

    LOG_INFO("Created output file: {} ({} Hz, {} ch)", filename, sampleRate, channels);
    return true;
}

void WavWriter::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool WavWriter::writeBlock(const float* buffer, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("Error: File not opened");
        return false;
    }

    sf_count_t written = sf_writef_float(file_, buffer, frames);
    if (written > 0) {
        framesWritten_ += written;
    }
    return written == frames;
}

// Utility functions
namespace Utils {

void monoToStereo(const float* mono, float* stereo, size_t frames) {
    for (size_t i = 0; i < frames; ++i) {
        stereo[i * 2] = mono[i];
        stereo[i * 2 + 1] = mono[i];
    }
}

void firstTwoChannels(const float* input, int channels, float* stereo, size_t frames) {
    const size_t stride = static_cast<size_t>(channels);
    for (size_t i = 0; i < frames; ++i) {
        stereo[i * 2] = input[i * stride];
        stereo[i * 2 + 1] = input[i * stride + 1];
    }
}

}  // namespace Utils

}  // namespace playout
