#include "core/config_loader.h"

#include "core/timing.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace playout {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

FadeCurve parseCurveOr(const nlohmann::json& j, const char* key, FadeCurve fallback,
                       bool verbose) {
    if (!j.contains(key) || !j[key].is_string()) {
        return fallback;
    }
    const std::string value = j[key].get<std::string>();
    auto parsed = parseFadeCurve(value);
    if (!parsed) {
        if (verbose) {
            LOG_WARN("Config: Unknown {} '{}', using '{}'", key, value,
                     fadeCurveToString(fallback));
        }
        return fallback;
    }
    return *parsed;
}

void parseLoggingSection(const nlohmann::json& section, logging::LogConfig& out, bool verbose) {
    try {
        if (section.contains("level") && section["level"].is_string()) {
            out.level = logging::stringToLevel(section["level"].get<std::string>());
        }
        if (section.contains("filePath") && section["filePath"].is_string()) {
            out.filePath = section["filePath"].get<std::string>();
        }
        if (section.contains("maxFileSizeMb")) {
            int mb = section["maxFileSizeMb"].get<int>();
            out.maxFileSize = static_cast<size_t>(std::clamp(mb, 1, 1024)) * 1024 * 1024;
        }
        if (section.contains("maxBackups")) {
            out.maxBackups = static_cast<size_t>(std::clamp(section["maxBackups"].get<int>(), 0, 100));
        }
        if (section.contains("consoleOutput")) {
            out.consoleOutput = section["consoleOutput"].get<bool>();
        }
        if (section.contains("coloredOutput")) {
            out.coloredOutput = section["coloredOutput"].get<bool>();
        }
        if (section.contains("pattern") && section["pattern"].is_string()) {
            out.pattern = section["pattern"].get<std::string>();
        }
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_WARN("Config: Invalid logging settings, using defaults: {}", e.what());
        }
        out = logging::LogConfig{};
    }
}

}  // namespace

ResamplerQuality parseResamplerQuality(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "best") {
        return ResamplerQuality::Best;
    }
    if (lower == "fastest" || lower == "fast") {
        return ResamplerQuality::Fastest;
    }
    // Default to Medium for "medium" or any invalid value
    return ResamplerQuality::Medium;
}

const char* resamplerQualityToString(ResamplerQuality quality) {
    switch (quality) {
    case ResamplerQuality::Best:
        return "best";
    case ResamplerQuality::Fastest:
        return "fastest";
    case ResamplerQuality::Medium:
    default:
        return "medium";
    }
}

bool loadEngineConfig(const std::filesystem::path& configPath, EngineConfig& outConfig,
                      bool verbose) {
    outConfig = EngineConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("workingSampleRate")) {
            int rate = j["workingSampleRate"].get<int>();
            if (rate > 0 && timing::isSupportedSampleRate(static_cast<uint32_t>(rate))) {
                outConfig.workingSampleRate = static_cast<uint32_t>(rate);
            } else if (verbose) {
                LOG_WARN("Config: Unsupported workingSampleRate {}, using {}", rate,
                         outConfig.workingSampleRate);
            }
        }
        if (j.contains("bufferCapacityFrames")) {
            int64_t frames = j["bufferCapacityFrames"].get<int64_t>();
            outConfig.bufferCapacityFrames = static_cast<size_t>(std::max<int64_t>(
                frames, static_cast<int64_t>(EngineConstants::MIN_BUFFER_CAPACITY_FRAMES)));
        }
        if (j.contains("playoutHeadroomFrames")) {
            outConfig.playoutHeadroomFrames =
                static_cast<size_t>(std::max<int64_t>(j["playoutHeadroomFrames"].get<int64_t>(), 0));
        }
        if (j.contains("resumeHysteresisFrames")) {
            int64_t hysteresis = j["resumeHysteresisFrames"].get<int64_t>();
            if (hysteresis > 0) {
                outConfig.resumeHysteresisFrames = static_cast<size_t>(hysteresis);
            } else if (verbose) {
                LOG_WARN("Config: resumeHysteresisFrames must be > 0 (got {}), using {}",
                         hysteresis, outConfig.resumeHysteresisFrames);
            }
        }
        if (j.contains("maximumDecodeStreams")) {
            outConfig.maximumDecodeStreams =
                static_cast<size_t>(std::max(j["maximumDecodeStreams"].get<int>(), 1));
        }
        if (j.contains("decodeChunkMs")) {
            int ms = j["decodeChunkMs"].get<int>();
            outConfig.decodeChunkMs = static_cast<uint32_t>(
                std::clamp(ms, static_cast<int>(EngineConstants::MIN_DECODE_CHUNK_MS),
                           static_cast<int>(EngineConstants::MAX_DECODE_CHUNK_MS)));
        }
        if (j.contains("minimumBufferMs")) {
            int ms = j["minimumBufferMs"].get<int>();
            outConfig.minimumBufferMs = static_cast<uint32_t>(
                std::clamp(ms, 0, static_cast<int>(EngineConstants::MAX_MINIMUM_BUFFER_MS)));
        }
        if (j.contains("pauseDecayFactor")) {
            float factor = j["pauseDecayFactor"].get<float>();
            if (factor > 0.0f && factor < 1.0f) {
                outConfig.pauseDecayFactor = factor;
            } else if (verbose) {
                LOG_WARN("Config: pauseDecayFactor must be in (0, 1) (got {}), using {}", factor,
                         outConfig.pauseDecayFactor);
            }
        }
        if (j.contains("pauseDecayFloor")) {
            float floorValue = j["pauseDecayFloor"].get<float>();
            if (floorValue > 0.0f) {
                outConfig.pauseDecayFloor = floorValue;
            } else if (verbose) {
                LOG_WARN("Config: pauseDecayFloor must be > 0 (got {}), using {}", floorValue,
                         outConfig.pauseDecayFloor);
            }
        }
        if (j.contains("masterVolume")) {
            outConfig.masterVolume = j["masterVolume"].get<float>();
        }
        if (j.contains("resumeFadeInMs")) {
            outConfig.resumeFadeInMs =
                static_cast<uint32_t>(std::clamp(j["resumeFadeInMs"].get<int>(), 0, 10000));
        }
        outConfig.resumeFadeCurve =
            parseCurveOr(j, "resumeFadeCurve", outConfig.resumeFadeCurve, verbose);
        if (j.contains("resamplerQuality") && j["resamplerQuality"].is_string()) {
            std::string value = j["resamplerQuality"].get<std::string>();
            outConfig.resamplerQuality = parseResamplerQuality(value);
            std::string normalized = toLower(value);
            if (normalized != "best" && normalized != "medium" && normalized != "fastest" &&
                normalized != "fast" && verbose) {
                LOG_WARN("Config: Unknown resamplerQuality '{}', falling back to 'medium'", value);
            }
        }
        outConfig.defaultFadeInCurve =
            parseCurveOr(j, "defaultFadeInCurve", outConfig.defaultFadeInCurve, verbose);
        outConfig.defaultFadeOutCurve =
            parseCurveOr(j, "defaultFadeOutCurve", outConfig.defaultFadeOutCurve, verbose);
        if (j.contains("positionUpdateIntervalMs")) {
            outConfig.positionUpdateIntervalMs =
                static_cast<uint32_t>(std::max(j["positionUpdateIntervalMs"].get<int>(), 0));
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            parseLoggingSection(j["logging"], outConfig.logging, verbose);
        }

        // Marks must leave room inside the buffer, otherwise a chain could
        // never reach the resume threshold.
        if (outConfig.playoutHeadroomFrames + outConfig.resumeHysteresisFrames >=
            outConfig.bufferCapacityFrames) {
            if (verbose) {
                LOG_WARN(
                    "Config: headroom ({}) + hysteresis ({}) must be below bufferCapacityFrames "
                    "({}), using default marks",
                    outConfig.playoutHeadroomFrames, outConfig.resumeHysteresisFrames,
                    outConfig.bufferCapacityFrames);
            }
            outConfig.playoutHeadroomFrames = outConfig.bufferCapacityFrames / 100;
            outConfig.resumeHysteresisFrames =
                std::max<size_t>(outConfig.bufferCapacityFrames / 10, 1);
        }

        // Clamp derived floating-point values after parsing
        outConfig.masterVolume = std::clamp(outConfig.masterVolume, 0.0f, 1.0f);

        if (verbose) {
            std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = EngineConfig{};
        return false;
    }
}

ErrorCode validateEngineConfig(const EngineConfig& config, std::string* reason) {
    auto fail = [reason](ErrorCode code, const std::string& message) {
        if (reason) {
            *reason = message;
        }
        return code;
    };

    if (!timing::isSupportedSampleRate(config.workingSampleRate)) {
        std::ostringstream oss;
        oss << "workingSampleRate " << config.workingSampleRate << " is not supported";
        return fail(ErrorCode::VALIDATION_INVALID_SAMPLE_RATE, oss.str());
    }
    if (config.bufferCapacityFrames == 0) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "bufferCapacityFrames must be > 0");
    }
    if (config.resumeHysteresisFrames == 0) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "resumeHysteresisFrames must be > 0");
    }
    if (config.playoutHeadroomFrames + config.resumeHysteresisFrames >=
        config.bufferCapacityFrames) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG,
                    "playoutHeadroomFrames + resumeHysteresisFrames must be below "
                    "bufferCapacityFrames");
    }
    if (config.maximumDecodeStreams == 0) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "maximumDecodeStreams must be >= 1");
    }
    if (config.decodeChunkMs < EngineConstants::MIN_DECODE_CHUNK_MS ||
        config.decodeChunkMs > EngineConstants::MAX_DECODE_CHUNK_MS) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "decodeChunkMs out of range");
    }
    if (config.minimumBufferMs > EngineConstants::MAX_MINIMUM_BUFFER_MS) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "minimumBufferMs out of range");
    }
    if (!(config.pauseDecayFactor > 0.0f && config.pauseDecayFactor < 1.0f)) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "pauseDecayFactor must be in (0, 1)");
    }
    if (!(config.pauseDecayFloor > 0.0f)) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "pauseDecayFloor must be > 0");
    }
    if (!(config.masterVolume >= 0.0f && config.masterVolume <= 1.0f)) {
        return fail(ErrorCode::VALIDATION_INVALID_CONFIG, "masterVolume must be in [0, 1]");
    }
    return ErrorCode::OK;
}

}  // namespace playout
