#include "audio/resampler.h"

#include "logging/logger.h"

#include <cmath>
#include <cstring>
#include <string>

namespace playout {

namespace {

constexpr int kChannels = 2;

// Extra output room per call on top of the nominal ratio.
constexpr size_t kOutputSlackFrames = 256;

int toConverterType(ResamplerQuality quality) {
    switch (quality) {
    case ResamplerQuality::Best:
        return SRC_SINC_BEST_QUALITY;
    case ResamplerQuality::Fastest:
        return SRC_SINC_FASTEST;
    case ResamplerQuality::Medium:
    default:
        return SRC_SINC_MEDIUM_QUALITY;
    }
}

InnerError samplerateError(ErrorCode code, const std::string& context, int rc) {
    InnerError error(code, context + ": " + src_strerror(rc));
    error.samplerate_error = rc;
    return error;
}

}  // namespace

Resampler::Resampler(uint32_t inputRate, uint32_t outputRate, ResamplerQuality quality)
    : inputRate_(inputRate),
      outputRate_(outputRate),
      quality_(quality),
      ratio_(inputRate > 0 ? static_cast<double>(outputRate) / static_cast<double>(inputRate)
                           : 0.0) {}

Resampler::~Resampler() {
    if (state_) {
        state_ = src_delete(state_);
    }
}

ErrorCode Resampler::initialize(InnerError& error) {
    if (inputRate_ == 0 || outputRate_ == 0 || !src_is_valid_ratio(ratio_)) {
        error = InnerError(ErrorCode::RESAMPLE_UNSUPPORTED_RATE,
                           "Unsupported rate pair " + std::to_string(inputRate_) + " -> " +
                               std::to_string(outputRate_));
        return error.code;
    }
    if (isPassThrough()) {
        return ErrorCode::OK;
    }

    int rc = 0;
    state_ = src_new(toConverterType(quality_), kChannels, &rc);
    if (!state_) {
        error = samplerateError(ErrorCode::RESAMPLE_INIT_FAILED,
                                "libsamplerate initialization has failed", rc);
        return error.code;
    }
    src_set_ratio(state_, ratio_);
    flushed_ = false;

    LOG_DEBUG("Resampler: {} Hz -> {} Hz ({}, ratio {:.4f})", inputRate_, outputRate_,
              src_get_name(toConverterType(quality_)), ratio_);
    return ErrorCode::OK;
}

ErrorCode Resampler::process(const float* input, size_t sampleCount, std::vector<float>& out,
                             InnerError& error) {
    if (sampleCount % kChannels != 0) {
        error = InnerError(ErrorCode::BUFFER_ODD_SAMPLE_COUNT,
                           "Resampler input has odd sample count " + std::to_string(sampleCount));
        return error.code;
    }
    if (isPassThrough()) {
        out.assign(input, input + sampleCount);
        return ErrorCode::OK;
    }
    if (!state_) {
        error = InnerError(ErrorCode::RESAMPLE_INIT_FAILED, "Resampler not initialized");
        return error.code;
    }
    if (flushed_) {
        error = InnerError(ErrorCode::RESAMPLE_PROCESS_FAILED, "Resampler already flushed");
        return error.code;
    }
    return run(input, sampleCount / kChannels, false, out, error);
}

ErrorCode Resampler::flush(std::vector<float>& out, InnerError& error) {
    out.clear();
    if (isPassThrough() || flushed_) {
        return ErrorCode::OK;
    }
    if (!state_) {
        error = InnerError(ErrorCode::RESAMPLE_INIT_FAILED, "Resampler not initialized");
        return error.code;
    }
    ErrorCode code = run(nullptr, 0, true, out, error);
    flushed_ = true;
    return code;
}

void Resampler::reset() {
    if (state_) {
        src_reset(state_);
    }
    flushed_ = false;
}

ErrorCode Resampler::run(const float* input, size_t frames, bool endOfInput,
                         std::vector<float>& out, InnerError& error) {
    // libsamplerate rejects null data pointers even with zero frames
    static const float kEmptyInput[kChannels] = {0.0f, 0.0f};

    out.clear();

    SRC_DATA data;
    std::memset(&data, 0, sizeof(data));
    data.src_ratio = ratio_;
    data.end_of_input = endOfInput ? 1 : 0;

    size_t inputUsed = 0;
    while (true) {
        const size_t remaining = frames - inputUsed;
        const size_t capacity =
            static_cast<size_t>(std::ceil(static_cast<double>(remaining) * ratio_)) +
            kOutputSlackFrames;
        const size_t outOffset = out.size() / kChannels;
        out.resize((outOffset + capacity) * kChannels);

        data.data_in = remaining > 0 ? input + inputUsed * kChannels : kEmptyInput;
        data.input_frames = static_cast<long>(remaining);
        data.data_out = out.data() + outOffset * kChannels;
        data.output_frames = static_cast<long>(capacity);

        int rc = src_process(state_, &data);
        if (rc != 0) {
            out.resize(outOffset * kChannels);
            error = samplerateError(ErrorCode::RESAMPLE_PROCESS_FAILED, "libsamplerate has failed",
                                    rc);
            return error.code;
        }

        inputUsed += static_cast<size_t>(data.input_frames_used);
        out.resize((outOffset + static_cast<size_t>(data.output_frames_gen)) * kChannels);

        const bool progressed = data.input_frames_used > 0 || data.output_frames_gen > 0;
        if (!progressed) {
            break;
        }
        if (inputUsed >= frames && !endOfInput) {
            break;
        }
        // With end_of_input set, keep pulling until the filter tail is empty
        if (inputUsed >= frames && endOfInput && data.output_frames_gen == 0) {
            break;
        }
    }
    return ErrorCode::OK;
}

}  // namespace playout
