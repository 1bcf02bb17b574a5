#ifndef RESAMPLER_H
#define RESAMPLER_H

#include "core/config_loader.h"
#include "core/error_codes.h"

#include <cstddef>
#include <cstdint>
#include <samplerate.h>
#include <vector>

namespace playout {

/**
 * @brief Stereo sample-rate converter for one decoder chain (libsamplerate).
 *
 * The converter state lives as long as the object, so successive chunks of
 * one passage are filtered as a single continuous stream. When input and
 * output rates match, process() copies the input through and no converter is
 * created.
 */
class Resampler {
   public:
    Resampler(uint32_t inputRate, uint32_t outputRate,
              ResamplerQuality quality = ResamplerQuality::Medium);
    ~Resampler();

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    /**
     * @brief Create the converter.
     *
     * @return OK, RESAMPLE_UNSUPPORTED_RATE for a rate outside the supported
     *         range, RESAMPLE_INIT_FAILED when libsamplerate refuses
     */
    ErrorCode initialize(InnerError& error);

    /**
     * @brief Convert one interleaved stereo chunk.
     *
     * out is replaced with the converted frames. Because of the filter delay
     * the first calls may produce fewer frames than the rate ratio suggests;
     * flush() returns the remainder.
     */
    ErrorCode process(const float* input, size_t sampleCount, std::vector<float>& out,
                      InnerError& error);

    /**
     * @brief Drain the filter delay at end of stream.
     *
     * After flush() the converter only accepts input again after reset().
     */
    ErrorCode flush(std::vector<float>& out, InnerError& error);

    void reset();

    bool isPassThrough() const {
        return inputRate_ == outputRate_;
    }

    uint32_t inputRate() const {
        return inputRate_;
    }
    uint32_t outputRate() const {
        return outputRate_;
    }
    double ratio() const {
        return ratio_;
    }

   private:
    ErrorCode run(const float* input, size_t frames, bool endOfInput, std::vector<float>& out,
                  InnerError& error);

    uint32_t inputRate_;
    uint32_t outputRate_;
    ResamplerQuality quality_;
    double ratio_;
    SRC_STATE* state_ = nullptr;
    bool flushed_ = false;
};

}  // namespace playout

#endif  // RESAMPLER_H
