#ifndef AUDIO_IO_H
#define AUDIO_IO_H

#include "audio/decoder.h"

#include <cstdint>
#include <optional>
#include <sndfile.h>
#include <string>
#include <vector>

namespace playout {

// Decoder adapter over libsndfile.
//
// Seeks to the passage start on open() and then hands out chunks of
// chunkMs worth of frames until the passage end (or the end of the file
// when no end is set). Mono is duplicated to both channels; sources with
// more than two channels keep the first two.
class SndfileDecoder : public Decoder {
   public:
    SndfileDecoder(const std::string& filename, int64_t startTicks, std::optional<int64_t> endTicks,
                   uint32_t chunkMs);
    ~SndfileDecoder() override;

    SndfileDecoder(const SndfileDecoder&) = delete;
    SndfileDecoder& operator=(const SndfileDecoder&) = delete;

    // Opens the file and seeks to the start. Failures fill error.
    bool open(InnerError& error);
    void close();

    DecodeStatus decodeChunk(AudioChunk& out, InnerError& error) override;
    std::optional<int64_t> discoveredEndTicks() const override;

    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }

   private:
    std::string filename_;
    int64_t startTicks_;
    std::optional<int64_t> endTicks_;
    uint32_t chunkMs_;

    SNDFILE* file_;
    SF_INFO info_;
    sf_count_t position_ = 0;  // next frame to read
    sf_count_t endFrame_ = 0;  // one past the last frame of the passage
    bool finished_ = false;
    bool failed_ = false;
    InnerError lastError_;

    std::vector<float> readBuffer_;  // native channel layout
};

// Float WAV writer used by the render tool.
class WavWriter {
   public:
    WavWriter();
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::string& filename, int sampleRate, int channels);
    void close();

    // Write interleaved frames
    bool writeBlock(const float* buffer, sf_count_t frames);

    sf_count_t framesWritten() const {
        return framesWritten_;
    }

   private:
    SNDFILE* file_;
    SF_INFO info_;
    sf_count_t framesWritten_ = 0;
};

// Channel layout helpers
namespace Utils {
// Convert mono to stereo (duplicate channel)
void monoToStereo(const float* mono, float* stereo, size_t frames);

// Keep the first two channels of an interleaved multichannel buffer
void firstTwoChannels(const float* input, int channels, float* stereo, size_t frames);
}  // namespace Utils

}  // namespace playout

#endif  // AUDIO_IO_H
