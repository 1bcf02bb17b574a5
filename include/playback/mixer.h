#ifndef MIXER_H
#define MIXER_H

#include "audio/fade_curve.h"
#include "core/config_loader.h"
#include "io/playout_ring_buffer.h"
#include "playback/backpressure.h"
#include "playback/passage.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace playout {

enum class PlaybackState { Playing, Paused };

const char* playbackStateToString(PlaybackState state);

// Notification produced on the output path, drained by the engine.
struct MixerEvent {
    enum class Type { Started, Completed };
    Type type = Type::Started;
    PassageId id = kInvalidPassageId;
};

/**
 * @brief Output-side mixer pulling pre-faded frames from one or two buffers.
 *
 * Sources:
 *   current - the passage being played
 *   next    - armed by the engine; joins the output either at the current
 *             passage's crossfade offset (overlap, both summed) or when the
 *             current buffer is exhausted (gapless)
 *
 * Overlap only starts once the next buffer is ready: it holds at least the
 * minimum buffer or its producer has finished. Until then the current
 * passage keeps playing alone, already shaped by its own fade-out.
 *
 * The mixer never applies curve math to the passages: each stream arrives
 * already shaped by its own chain. It only sums, clamps and scales by the
 * master volume.
 *
 * Thread safety:
 *   mix() runs on the output thread. Every other method may be called from
 *   control threads. sourceMutex_ guards the source slots and is held only to
 *   copy them out before a block and to write the progress back after it,
 *   never across the sample copy. A buffer detached from the mixer may still
 *   be read by a block in flight; its owner keeps it alive until
 *   mixesCompleted() reaches the mixesStarted() value seen at detach time.
 */
class Mixer {
   public:
    // Largest block handled in one pass; larger requests are split.
    static constexpr size_t kMaxBlockFrames = 4096;
    static constexpr size_t kEventCapacity = 64;

    explicit Mixer(const EngineConfig& config);

    Mixer(const Mixer&) = delete;
    Mixer& operator=(const Mixer&) = delete;

    /**
     * @brief Produce exactly frames interleaved stereo frames into output.
     *
     * Never blocks on data: shortfalls are silence.
     */
    void mix(float* output, size_t frames);

    // Convenience for offline callers.
    std::vector<float> mix(size_t frames);

    // Source management (control thread)

    // Installs the current source only when the mixer has none.
    bool setCurrentIfIdle(PassageId id, std::shared_ptr<PlayoutRingBuffer> buffer,
                          std::optional<int64_t> crossfadeOffsetTicks);

    // Arms next only while expectedCurrent is playing and no next is armed.
    bool armNext(PassageId expectedCurrent, PassageId id, std::shared_ptr<PlayoutRingBuffer> buffer,
                 std::optional<int64_t> crossfadeOffsetTicks);

    // Detaches a source. Removing the current one promotes next.
    // Returns false when id is neither current nor next.
    bool removeSource(PassageId id);
    void clearSources();

    PassageId currentPassage() const;
    PassageId nextPassage() const;
    bool isOverlapping() const;

    // State
    void play();
    void pause();
    PlaybackState state() const {
        return state_.load(std::memory_order_acquire);
    }

    // Clamped to [0.0, 1.0].
    void setMasterVolume(float volume);
    float masterVolume() const {
        return masterVolume_.load(std::memory_order_relaxed);
    }

    // Position of the current passage relative to its start.
    int64_t positionTicks() const;
    uint64_t positionFrames() const {
        return positionFrames_.load(std::memory_order_relaxed);
    }
    uint64_t framesWritten() const {
        return framesWritten_.load(std::memory_order_relaxed);
    }
    uint64_t underrunFrames() const {
        return underrunFrames_.load(std::memory_order_relaxed);
    }

    // Moves pending output-path events into out. Single consumer.
    void drainEvents(std::vector<MixerEvent>& out);

    // Source-reading passes begun / finished by the output thread.
    uint64_t mixesStarted() const {
        return mixesStarted_.load(std::memory_order_acquire);
    }
    uint64_t mixesCompleted() const {
        return mixesCompleted_.load(std::memory_order_acquire);
    }

    // Frames a next buffer must hold before an overlap may start.
    size_t readyFrames() const {
        return readyFrames_;
    }

   private:
    struct Source {
        PassageId id = kInvalidPassageId;
        std::shared_ptr<PlayoutRingBuffer> buffer;
        std::optional<uint64_t> crossfadeStartFrame;
        uint64_t positionFrames = 0;
        bool announced = false;

        bool valid() const {
            return id != kInvalidPassageId && buffer != nullptr;
        }
    };

    struct Sources {
        Source current;
        Source next;
        bool overlapping = false;
    };

    void mixBlock(float* output, size_t frames);
    void mixPlaying(float* output, size_t frames);
    void mixPaused(float* output, size_t frames);

    // Single-source read up to `frames`, stopping at a crossfade start.
    size_t readCurrent(Sources& sources, float* output, size_t frames);
    size_t readOverlap(Sources& sources, float* output, size_t frames);

    bool isReady(const Source& source) const;
    void completeCurrent(Sources& sources);
    static void promoteNext(Sources& sources);
    void announce(Source& source);
    void pushEvent(MixerEvent::Type type, PassageId id);

    // Called with sourceMutex_ held
    void reconcile(const Sources& mixed);
    void publishPosition();

    std::optional<uint64_t> toFrames(std::optional<int64_t> ticks) const;

    uint32_t workingRate_;
    size_t readyFrames_;
    float decayFactor_;
    float decayFloor_;
    size_t resumeFadeFrames_;
    FadeCurve resumeFadeCurve_;

    mutable std::mutex sourceMutex_;
    Sources sources_;
    uint64_t generation_ = 0;  // bumped by every control-side change

    std::atomic<PlaybackState> state_{PlaybackState::Paused};
    std::atomic<float> masterVolume_;

    // Output thread only
    PlaybackState renderedState_ = PlaybackState::Paused;
    uint64_t playedFrames_ = 0;
    size_t resumeFadePosition_ = 0;
    bool resumeFading_ = false;
    std::array<float, 2> lastFrame_{{0.0f, 0.0f}};
    std::vector<float> scratchCurrent_;
    std::vector<float> scratchNext_;
    std::array<PassageId, 2> completedInBlock_{{kInvalidPassageId, kInvalidPassageId}};
    size_t completedCount_ = 0;

    std::atomic<uint64_t> mixesStarted_{0};
    std::atomic<uint64_t> mixesCompleted_{0};

    std::atomic<uint64_t> positionFrames_{0};
    std::atomic<uint64_t> framesWritten_{0};
    std::atomic<uint64_t> underrunFrames_{0};

    // SPSC event ring: output thread produces, engine consumes
    std::array<MixerEvent, kEventCapacity> events_;
    std::atomic<size_t> eventHead_{0};
    std::atomic<size_t> eventTail_{0};
    std::atomic<uint64_t> droppedEvents_{0};
};

}  // namespace playout

#endif  // MIXER_H
