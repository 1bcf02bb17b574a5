#include "audio/audio_io.h"
#include "core/config_loader.h"
#include "core/engine_constants.h"
#include "core/timing.h"
#include "logging/logger.h"
#include "playback/playback_engine.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

void printUsage(const char* programName) {
    std::cout << "Playout Render - offline playback of a passage queue" << std::endl;
    std::cout << "Usage: " << programName << " <output.wav> <input...> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>       Engine JSON config (default: "
              << playout::DEFAULT_CONFIG_FILE << ")" << std::endl;
    std::cout << "  --crossfade-ms <n>    Crossfade between consecutive inputs (default: 0)"
              << std::endl;
    std::cout << "  --volume <v>          Master volume 0.0 - 1.0 (default: from config)"
              << std::endl;
    std::cout << "  --block <frames>      Output block size (default: "
              << EngineConstants::DEFAULT_RENDER_BLOCK_FRAMES << ")" << std::endl;
    std::cout << "  --help                Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << programName << " mix.wav a.flac b.flac" << std::endl;
    std::cout << "  " << programName << " mix.wav a.wav b.wav --crossfade-ms 3000 --volume 0.8"
              << std::endl;
}

struct RenderOptions {
    std::string outputFile;
    std::vector<std::string> inputFiles;
    std::string configPath = playout::DEFAULT_CONFIG_FILE;
    int crossfadeMs = EngineConstants::DEFAULT_RENDER_CROSSFADE_MS;
    float volume = -1.0f;  // < 0: keep config value
    size_t blockFrames = EngineConstants::DEFAULT_RENDER_BLOCK_FRAMES;
};

bool parseArguments(int argc, char* argv[], RenderOptions& options) {
    if (argc < 3) {
        return false;
    }

    options.outputFile = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                return false;
            } else if (arg == "--config" && i + 1 < argc) {
                options.configPath = argv[++i];
            } else if (arg == "--crossfade-ms" && i + 1 < argc) {
                options.crossfadeMs = std::stoi(argv[++i]);
            } else if (arg == "--volume" && i + 1 < argc) {
                options.volume = std::stof(argv[++i]);
            } else if (arg == "--block" && i + 1 < argc) {
                int block = std::stoi(argv[++i]);
                if (block <= 0) {
                    std::cerr << "Invalid block size: " << block << std::endl;
                    return false;
                }
                options.blockFrames = static_cast<size_t>(block);
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            } else {
                options.inputFiles.push_back(arg);
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
            return false;
        }
    }

    return !options.inputFiles.empty();
}

// Build passages with the requested crossfade. The file length is read up
// front so the fade-out point can be placed before the end.
static bool buildPassages(const RenderOptions& options, const playout::EngineConfig& config,
                          std::vector<playout::Passage>& passages) {
    const int64_t crossfadeTicks = playout::timing::msToTicks(std::max(options.crossfadeMs, 0));

    for (size_t i = 0; i < options.inputFiles.size(); ++i) {
        const std::string& path = options.inputFiles[i];

        playout::SndfileDecoder lengthReader(path, 0, std::nullopt, config.decodeChunkMs);
        playout::InnerError error;
        if (!lengthReader.open(error)) {
            std::cerr << "Error: " << error.cpp_message << std::endl;
            return false;
        }
        std::optional<int64_t> duration = lengthReader.discoveredEndTicks();
        lengthReader.close();

        playout::Passage passage;
        passage.filePath = path;
        passage.fadeInCurve = config.defaultFadeInCurve;
        passage.fadeOutCurve = config.defaultFadeOutCurve;
        passage.timing.endTicks = duration;

        if (crossfadeTicks > 0 && duration && *duration > 2 * crossfadeTicks) {
            if (i > 0) {
                passage.timing.fadeInPointTicks = crossfadeTicks;
            }
            if (i + 1 < options.inputFiles.size()) {
                passage.timing.fadeOutPointTicks = *duration - crossfadeTicks;
            }
        } else if (crossfadeTicks > 0) {
            LOG_WARN("{} is too short for a {}ms crossfade, playing it without fades", path,
                     options.crossfadeMs);
        }
        passages.push_back(passage);
    }
    return true;
}

int main(int argc, char* argv[]) {
    playout::logging::initializeEarly();

    RenderOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    playout::EngineConfig config;
    if (std::filesystem::exists(options.configPath)) {
        playout::logging::initializeFromConfig(options.configPath);
        if (!playout::loadEngineConfig(options.configPath, config)) {
            LOG_ERROR("Failed to load {}, using defaults", options.configPath);
        }
    }
    if (options.volume >= 0.0f) {
        config.masterVolume = options.volume;
    }

    std::string reason;
    playout::ErrorCode code = playout::validateEngineConfig(config, &reason);
    if (code != playout::ErrorCode::OK) {
        LOG_ERROR("Invalid configuration ({}): {}", playout::errorCodeToString(code), reason);
        return 1;
    }

    std::vector<playout::Passage> passages;
    if (!buildPassages(options, config, passages)) {
        return 1;
    }

    playout::WavWriter writer;
    if (!writer.open(options.outputFile, static_cast<int>(config.workingSampleRate),
                     EngineConstants::CHANNELS)) {
        return 1;
    }

    auto startTime = std::chrono::steady_clock::now();

    playout::PlaybackEngine engine(config);
    int failures = 0;
    engine.events().subscribe([&failures](const playout::events::PassageError& event) {
        ++failures;
        LOG_ERROR("Passage {} failed: {} ({})", event.id, playout::errorCodeToString(event.error.code),
                  event.error.cpp_message);
    });

    for (const auto& passage : passages) {
        code = engine.enqueue(passage);
        if (code != playout::ErrorCode::OK) {
            LOG_ERROR("Cannot queue {}: {}", passage.filePath, playout::errorCodeToString(code));
            return 1;
        }
    }
    engine.play();

    // Drive the engine offline: decode until idle, then pull one block.
    constexpr int kMaxTicksPerBlock = 256;
    constexpr int kMaxIdleBlocks = 1000;
    std::vector<float> block(options.blockFrames * EngineConstants::CHANNELS);
    int idleBlocks = 0;

    while (engine.queueLength() > 0) {
        int ticks = 0;
        bool worked = false;
        while (ticks < kMaxTicksPerBlock && engine.tick()) {
            worked = true;
            ++ticks;
        }

        engine.mix(block.data(), options.blockFrames);
        if (!writer.writeBlock(block.data(), static_cast<sf_count_t>(options.blockFrames))) {
            LOG_ERROR("Write failed for {}", options.outputFile);
            return 1;
        }

        idleBlocks = (worked || engine.currentPassage() != playout::kInvalidPassageId)
                         ? 0
                         : idleBlocks + 1;
        if (idleBlocks > kMaxIdleBlocks) {
            LOG_ERROR("Engine stalled with {} passages queued", engine.queueLength());
            return 1;
        }
    }
    writer.close();

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime);
    const double seconds =
        static_cast<double>(writer.framesWritten()) / static_cast<double>(config.workingSampleRate);
    std::cout << "Rendered " << seconds << " s to " << options.outputFile << " in "
              << elapsed.count() << " s" << std::endl;

    playout::logging::shutdown();
    return failures > 0 ? 2 : 0;
}
