#ifndef ENGINE_CONSTANTS_H
#define ENGINE_CONSTANTS_H

#include <cstddef>  // for size_t
#include <cstdint>

// Defaults and limits shared by the engine, the config loader and the tools

namespace EngineConstants {

// Audio format
constexpr uint32_t DEFAULT_WORKING_SAMPLE_RATE = 44100;
constexpr int CHANNELS = 2;

// Per-passage buffer: 15 seconds at the default working rate
constexpr size_t DEFAULT_BUFFER_CAPACITY_FRAMES = 661500;
constexpr size_t MIN_BUFFER_CAPACITY_FRAMES = 1024;

// Backpressure marks (free space, frames)
// Yield when free space drops to the headroom; resume once it exceeds
// headroom + hysteresis.
constexpr size_t DEFAULT_PLAYOUT_HEADROOM_FRAMES = 4410;     // 100ms @ 44.1k
constexpr size_t DEFAULT_RESUME_HYSTERESIS_FRAMES = 44100;   // 1s @ 44.1k

// Decode scheduling
constexpr size_t DEFAULT_MAXIMUM_DECODE_STREAMS = 2;  // current + next
constexpr uint32_t DEFAULT_DECODE_CHUNK_MS = 1000;
constexpr uint32_t MIN_DECODE_CHUNK_MS = 10;
constexpr uint32_t MAX_DECODE_CHUNK_MS = 10000;

// Buffered audio required before a passage starts or is crossfaded into
constexpr uint32_t DEFAULT_MINIMUM_BUFFER_MS = 3000;
constexpr uint32_t MAX_MINIMUM_BUFFER_MS = 60000;

// Pause decay: full scale to -75dB in ~6ms at 44.1k
constexpr float DEFAULT_PAUSE_DECAY_FACTOR = 0.96875f;
constexpr float DEFAULT_PAUSE_DECAY_FLOOR = 0.0001778f;

constexpr float DEFAULT_MASTER_VOLUME = 1.0f;

// Position events
constexpr uint32_t DEFAULT_POSITION_UPDATE_INTERVAL_MS = 1000;

// Render tool
constexpr size_t DEFAULT_RENDER_BLOCK_FRAMES = 1024;
constexpr int DEFAULT_RENDER_CROSSFADE_MS = 0;

}  // namespace EngineConstants

#endif  // ENGINE_CONSTANTS_H
