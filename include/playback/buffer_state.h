#pragma once

#include <cstddef>
#include <cstdint>

namespace playout {

/**
 * @brief Lifecycle of a passage buffer as tracked by the engine.
 *
 *   Empty    -> Filling   first frame pushed
 *   Filling  -> Ready     minimum buffer reached
 *   any      -> Finished  producer done (end of stream or chain failure)
 *   Ready | Finished -> Playing  mixer read the first frame
 *
 * Ready, Playing and Finished buffers may be started or crossfaded into.
 */
enum class BufferState { Empty, Filling, Ready, Playing, Finished };

inline const char* bufferStateToString(BufferState state) {
    switch (state) {
    case BufferState::Empty:
        return "empty";
    case BufferState::Filling:
        return "filling";
    case BufferState::Ready:
        return "ready";
    case BufferState::Playing:
        return "playing";
    case BufferState::Finished:
    default:
        return "finished";
    }
}

inline bool isPlayable(BufferState state) {
    return state == BufferState::Ready || state == BufferState::Playing ||
           state == BufferState::Finished;
}

}  // namespace playout
