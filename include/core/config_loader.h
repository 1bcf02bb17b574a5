#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "audio/fade_curve.h"
#include "core/engine_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace playout {

constexpr const char* DEFAULT_CONFIG_FILE = "playout.json";

// Sample-rate converter quality (libsamplerate converter type)
enum class ResamplerQuality {
    Best,     // SRC_SINC_BEST_QUALITY
    Medium,   // SRC_SINC_MEDIUM_QUALITY
    Fastest   // SRC_SINC_FASTEST
};

// Construction-time configuration for the engine, worker and mixer.
struct EngineConfig {
    uint32_t workingSampleRate = EngineConstants::DEFAULT_WORKING_SAMPLE_RATE;
    size_t bufferCapacityFrames = EngineConstants::DEFAULT_BUFFER_CAPACITY_FRAMES;

    // Backpressure: a chain yields when free space <= playoutHeadroomFrames
    // and resumes once free space >= playoutHeadroomFrames + resumeHysteresisFrames.
    size_t playoutHeadroomFrames = EngineConstants::DEFAULT_PLAYOUT_HEADROOM_FRAMES;
    size_t resumeHysteresisFrames = EngineConstants::DEFAULT_RESUME_HYSTERESIS_FRAMES;

    size_t maximumDecodeStreams = EngineConstants::DEFAULT_MAXIMUM_DECODE_STREAMS;
    uint32_t decodeChunkMs = EngineConstants::DEFAULT_DECODE_CHUNK_MS;

    // A buffer becomes ready (playable, crossfade target) once it holds this
    // much audio or its decode has finished. Clamped to what the buffer can
    // hold above the headroom.
    uint32_t minimumBufferMs = EngineConstants::DEFAULT_MINIMUM_BUFFER_MS;

    float pauseDecayFactor = EngineConstants::DEFAULT_PAUSE_DECAY_FACTOR;
    float pauseDecayFloor = EngineConstants::DEFAULT_PAUSE_DECAY_FLOOR;
    float masterVolume = EngineConstants::DEFAULT_MASTER_VOLUME;

    // Fade-in applied on resume from pause. 0 disables it.
    uint32_t resumeFadeInMs = 0;
    FadeCurve resumeFadeCurve = FadeCurve::Exponential;

    ResamplerQuality resamplerQuality = ResamplerQuality::Medium;

    FadeCurve defaultFadeInCurve = FadeCurve::Exponential;
    FadeCurve defaultFadeOutCurve = FadeCurve::Logarithmic;

    uint32_t positionUpdateIntervalMs = EngineConstants::DEFAULT_POSITION_UPDATE_INTERVAL_MS;

    logging::LogConfig logging;
};

ResamplerQuality parseResamplerQuality(const std::string& str);
const char* resamplerQualityToString(ResamplerQuality quality);

/**
 * @brief Load engine configuration from a JSON file
 *
 * outConfig is reset to defaults first. Missing keys keep their defaults;
 * out-of-range values are clamped or replaced with defaults (warning logged
 * when verbose).
 *
 * @return true if the file was read and parsed, false on missing file or
 *         parse error (outConfig then holds defaults)
 */
bool loadEngineConfig(const std::filesystem::path& configPath, EngineConfig& outConfig,
                      bool verbose = true);

/**
 * @brief Check a config built in code
 *
 * @param reason Receives a description of the first violation (optional)
 * @return ErrorCode::OK or the first violated constraint
 */
ErrorCode validateEngineConfig(const EngineConfig& config, std::string* reason = nullptr);

}  // namespace playout

#endif  // CONFIG_LOADER_H
