#ifndef BACKPRESSURE_H
#define BACKPRESSURE_H

#include "core/config_loader.h"

#include <algorithm>
#include <cstddef>

namespace playout {
namespace Backpressure {

/**
 * @brief Free-space marks (frames) steering a chain between Active and Yielded.
 *
 * A chain stops pushing once free space would drop below yieldFreeFrames
 * (the low-water mark) and is only polled again when free space has grown
 * back to resumeFreeFrames (the high-water mark). resumeFreeFrames is always
 * strictly greater than yieldFreeFrames.
 */
struct Marks {
    size_t yieldFreeFrames = 0;
    size_t resumeFreeFrames = 1;
};

/**
 * @brief Derive the marks for one buffer.
 *
 * @param capacityFrames      Ring buffer capacity.
 * @param headroomFrames      Free space kept untouched by the producer.
 * @param hysteresisFrames    Distance between the two marks. Clamped to >= 1.
 *
 * @return Marks with resume clamped to the capacity, so an empty buffer
 *         always allows resuming.
 */
inline Marks computeMarks(size_t capacityFrames, size_t headroomFrames, size_t hysteresisFrames) {
    Marks marks;
    size_t safeCapacity = std::max<size_t>(capacityFrames, 2);
    marks.resumeFreeFrames =
        std::min(safeCapacity, headroomFrames + std::max<size_t>(hysteresisFrames, 1));
    marks.yieldFreeFrames = std::min(headroomFrames, marks.resumeFreeFrames - 1);
    return marks;
}

// Frames the producer may still push without eating into the headroom.
inline size_t writableFrames(size_t freeFrames, const Marks& marks) {
    return freeFrames > marks.yieldFreeFrames ? freeFrames - marks.yieldFreeFrames : 0;
}

inline bool shouldResume(size_t freeFrames, const Marks& marks) {
    return freeFrames >= marks.resumeFreeFrames;
}

/**
 * @brief Frames a buffer must hold before playback may start from it.
 *
 * Clamped to what the producer can store before it yields, so a passage
 * longer than the buffer always gets there. At least one frame.
 */
inline size_t readyFrames(size_t thresholdFrames, size_t capacityFrames, const Marks& marks) {
    const size_t storable =
        capacityFrames > marks.yieldFreeFrames ? capacityFrames - marks.yieldFreeFrames : 1;
    return std::clamp<size_t>(thresholdFrames, 1, storable);
}

// minimumBufferMs of the config, in working-rate frames.
inline size_t readyFrames(const EngineConfig& config) {
    const Marks marks = computeMarks(config.bufferCapacityFrames, config.playoutHeadroomFrames,
                                     config.resumeHysteresisFrames);
    const size_t threshold =
        static_cast<size_t>(config.minimumBufferMs) * config.workingSampleRate / 1000;
    return readyFrames(threshold, config.bufferCapacityFrames, marks);
}

}  // namespace Backpressure
}  // namespace playout

#endif  // BACKPRESSURE_H
