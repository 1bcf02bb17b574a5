#ifndef PLAYOUT_RING_BUFFER_H
#define PLAYOUT_RING_BUFFER_H

#include "core/error_codes.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace playout {

struct PushResult {
    ErrorCode error = ErrorCode::OK;
    size_t framesWritten = 0;
};

// Lock-free ring buffer (single producer/single consumer) of interleaved
// stereo frames, one per passage.
//
// Usage:
//   PlayoutRingBuffer buffer(capacityFrames);
//   buffer.push(samples, sampleCount);   // decoder worker
//   buffer.pop(dst, frames);             // output path
//
// Thread safety:
//   Producer thread calls push()/markFinished(), consumer thread calls pop().
//   Neither side ever waits: push() truncates at capacity and pop() returns
//   fewer frames on underrun.
//
// Memory ordering / invariants:
//   - SPSC only: producer is the sole writer of tail_, consumer is the sole
//     writer of head_ (both use relaxed operations).
//   - size_ is the synchronization point between threads:
//       * push(): sample writes happen-before size_.fetch_add(..., release)
//       * pop(): size_.load(acquire) happens-before reading samples
//   - size_ never exceeds capacity().
//   - clear() must be externally synchronized (no concurrent push/pop).
class PlayoutRingBuffer {
   public:
    static constexpr size_t CHANNELS = 2;

    explicit PlayoutRingBuffer(size_t capacityFrames) : buffer_(capacityFrames * CHANNELS, 0.0f) {}

    PlayoutRingBuffer(const PlayoutRingBuffer&) = delete;
    PlayoutRingBuffer& operator=(const PlayoutRingBuffer&) = delete;

    // Capacity in stereo frames.
    size_t capacity() const {
        return buffer_.size() / CHANNELS;
    }

    // Frames currently stored.
    size_t len() const {
        return size_.load(std::memory_order_acquire);
    }

    size_t freeSpace() const {
        return capacity() - len();
    }

    bool isEmpty() const {
        return len() == 0;
    }

    // Producer thread calls this.
    // Writes as many whole frames as fit; the rest is left to the caller.
    // sampleCount must be a multiple of CHANNELS, otherwise nothing is written
    // and BUFFER_ODD_SAMPLE_COUNT is returned.
    PushResult push(const float* samples, size_t sampleCount) {
        PushResult result;
        if (sampleCount % CHANNELS != 0) {
            result.error = ErrorCode::BUFFER_ODD_SAMPLE_COUNT;
            return result;
        }
        const size_t cap = capacity();
        if (cap == 0) {
            result.error = ErrorCode::BUFFER_NOT_ALLOCATED;
            return result;
        }
        const size_t frames = std::min(sampleCount / CHANNELS, freeSpace());
        if (frames == 0 || samples == nullptr) {
            return result;
        }

        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t first = std::min(frames, cap - tail);
        std::memcpy(buffer_.data() + tail * CHANNELS, samples, first * CHANNELS * sizeof(float));
        const size_t remaining = frames - first;
        if (remaining > 0) {
            std::memcpy(buffer_.data(), samples + first * CHANNELS,
                        remaining * CHANNELS * sizeof(float));
        }
        tail_.store((tail + frames) % cap, std::memory_order_relaxed);
        size_.fetch_add(frames, std::memory_order_release);
        totalPushed_.fetch_add(frames, std::memory_order_relaxed);

        result.framesWritten = frames;
        return result;
    }

    // Consumer thread calls this.
    // Copies up to frames frames into dst (frames * CHANNELS floats) and
    // returns how many were copied. The caller pads the rest.
    size_t pop(float* dst, size_t frames) {
        const size_t cap = capacity();
        if (cap == 0 || dst == nullptr) {
            return 0;
        }
        const size_t count = std::min(frames, len());
        if (count == 0) {
            return 0;
        }

        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t first = std::min(count, cap - head);
        std::memcpy(dst, buffer_.data() + head * CHANNELS, first * CHANNELS * sizeof(float));
        const size_t remaining = count - first;
        if (remaining > 0) {
            std::memcpy(dst + first * CHANNELS, buffer_.data(),
                        remaining * CHANNELS * sizeof(float));
        }
        head_.store((head + count) % cap, std::memory_order_relaxed);
        size_.fetch_sub(count, std::memory_order_release);
        totalPopped_.fetch_add(count, std::memory_order_relaxed);
        return count;
    }

    void clear() {
        head_.store(0, std::memory_order_relaxed);
        tail_.store(0, std::memory_order_relaxed);
        size_.store(0, std::memory_order_release);
    }

    // Producer signals that no more frames will be pushed.
    void markFinished() {
        finished_.store(true, std::memory_order_release);
    }

    bool isFinished() const {
        return finished_.load(std::memory_order_acquire);
    }

    // Finished and fully drained.
    bool isExhausted() const {
        return isFinished() && isEmpty();
    }

    uint64_t totalFramesPushed() const {
        return totalPushed_.load(std::memory_order_relaxed);
    }

    uint64_t totalFramesPopped() const {
        return totalPopped_.load(std::memory_order_relaxed);
    }

   private:
    std::vector<float> buffer_;
    std::atomic<size_t> head_{0};  // read frame (consumer updates)
    std::atomic<size_t> tail_{0};  // write frame (producer updates)
    std::atomic<size_t> size_{0};  // frames stored (both read, respective owner updates)
    std::atomic<bool> finished_{false};
    std::atomic<uint64_t> totalPushed_{0};
    std::atomic<uint64_t> totalPopped_{0};
};

}  // namespace playout

#endif  // PLAYOUT_RING_BUFFER_H
