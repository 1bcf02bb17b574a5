#ifndef PLAYBACK_ENGINE_H
#define PLAYBACK_ENGINE_H

#include "audio/decoder.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "io/playout_ring_buffer.h"
#include "playback/buffer_state.h"
#include "playback/decoder_worker.h"
#include "playback/mixer.h"
#include "playback/passage.h"
#include "playback/playback_events.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace playout {

// Opens the decoder for a passage. nullptr + error on failure.
using DecoderFactory =
    std::function<std::unique_ptr<Decoder>(const Passage&, const EngineConfig&, InnerError&)>;

// Default factory: libsndfile over passage.filePath.
std::unique_ptr<Decoder> openSndfileDecoder(const Passage& passage, const EngineConfig& config,
                                            InnerError& error);

struct QueueEntry {
    PassageId id = kInvalidPassageId;
    Passage passage;
};

/**
 * @brief Queue-facing orchestration of the worker and the mixer.
 *
 * The engine owns no thread. A driver calls tick() repeatedly (one worker
 * iteration each) and the output device calls mix(). Every other method is
 * for control threads; they are serialized against tick() so a chain is
 * never torn down while it is being advanced. Events are published after the
 * engine lock is released, so handlers may call back into the engine.
 *
 * A passage starts, or is crossfaded into, only once its buffer is ready
 * (see BufferState). While the playing passage has its minimum buffered and
 * the following one does not, both share the Immediate decode class so the
 * following buffer fills before its crossfade point.
 */
class PlaybackEngine {
   public:
    explicit PlaybackEngine(const EngineConfig& config,
                            DecoderFactory decoderFactory = openSndfileDecoder);
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    // Appends a passage. VALIDATION_INVALID_TIMING for bad timing points.
    ErrorCode enqueue(const Passage& passage, PassageId* outId = nullptr);

    // Tears down the passage's chain and releases its buffer.
    ErrorCode remove(PassageId id);

    // Removes the passage being played (or the queue head before playback).
    ErrorCode skip();

    void clear();

    void play();
    void pause();
    PlaybackState state() const;

    // One scheduling iteration. Returns true when decode work was done.
    bool tick();

    // Output path: always fills exactly frames frames.
    void mix(float* output, size_t frames);
    std::vector<float> mix(size_t frames);

    void setMasterVolume(float volume);
    float masterVolume() const;

    std::vector<QueueEntry> queueSnapshot() const;
    size_t queueLength() const;
    PassageId currentPassage() const;
    int64_t positionTicks() const;
    std::optional<ChainState> chainState(PassageId id) const;
    std::optional<BufferState> bufferState(PassageId id) const;

    events::PlaybackEvents& events() {
        return events_;
    }

    const EngineConfig& config() const {
        return config_;
    }

   private:
    struct Entry {
        PassageId id = kInvalidPassageId;
        Passage passage;
        std::shared_ptr<PlayoutRingBuffer> buffer;  // created with the chain
        BufferState bufferState = BufferState::Empty;
        bool decodeFinished = false;
        bool errorReported = false;
    };

    // Buffer detached while the output thread may still be reading it
    struct RetiredBuffer {
        uint64_t mixEpoch = 0;
        std::shared_ptr<PlayoutRingBuffer> buffer;
    };

    using PendingEvent =
        std::variant<events::QueueChanged, events::PlaybackStateChanged, events::PassageStarted,
                     events::PassageCompleted, events::PositionUpdate, events::PassageError,
                     events::BufferStateChanged>;

    std::unique_ptr<DecoderChain> createChain(PassageId id, InnerError& error);

    void handleMixerEvents(std::vector<PendingEvent>& pending);
    void handleFailures(const IterationResult& result, std::vector<PendingEvent>& pending);
    void updatePriorities();
    void updateBufferStates(std::vector<PendingEvent>& pending);
    void setBufferState(Entry& entry, BufferState state, std::vector<PendingEvent>& pending);
    void syncMixer();
    void collectPosition(std::vector<PendingEvent>& pending);
    ErrorCode removeLocked(PassageId id, bool skipped, bool announce,
                           std::vector<PendingEvent>& pending);

    void retire(std::shared_ptr<PlayoutRingBuffer> buffer);
    void releaseRetired();

    void publish(const std::vector<PendingEvent>& pending);

    Entry* find(PassageId id);
    bool isReady(const Entry& entry) const;
    static DecodePriority priorityForIndex(size_t index);

    EngineConfig config_;
    size_t readyFrames_;
    DecoderFactory decoderFactory_;
    Mixer mixer_;
    DecoderWorker worker_;
    events::PlaybackEvents events_;

    mutable std::mutex engineMutex_;
    std::vector<Entry> queue_;
    std::vector<RetiredBuffer> retired_;
    PassageId nextId_ = 1;

    std::vector<MixerEvent> mixerEvents_;
    PassageId positionPassage_ = kInvalidPassageId;
    uint64_t lastPositionFrames_ = 0;
};

}  // namespace playout

#endif  // PLAYBACK_ENGINE_H
