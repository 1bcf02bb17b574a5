#pragma once

#include "core/error_codes.h"
#include "playback/buffer_state.h"
#include "playback/mixer.h"
#include "playback/passage.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace playout::events {

struct QueueChanged {
    size_t queueLength = 0;
};

struct PlaybackStateChanged {
    PlaybackState state = PlaybackState::Paused;
};

struct PassageStarted {
    PassageId id = kInvalidPassageId;
};

struct PassageCompleted {
    PassageId id = kInvalidPassageId;
    bool skipped = false;  // removed before its buffer drained
};

struct PositionUpdate {
    PassageId id = kInvalidPassageId;
    int64_t positionTicks = 0;
};

struct BufferStateChanged {
    PassageId id = kInvalidPassageId;
    BufferState oldState = BufferState::Empty;
    BufferState newState = BufferState::Empty;
    uint64_t framesBuffered = 0;  // pushed so far
};

struct PassageError {
    PassageId id = kInvalidPassageId;
    InnerError error;
};

class PlaybackEvents {
   public:
    using QueueChangedHandler = std::function<void(const QueueChanged&)>;
    using StateChangedHandler = std::function<void(const PlaybackStateChanged&)>;
    using StartedHandler = std::function<void(const PassageStarted&)>;
    using CompletedHandler = std::function<void(const PassageCompleted&)>;
    using PositionHandler = std::function<void(const PositionUpdate&)>;
    using ErrorHandler = std::function<void(const PassageError&)>;
    using BufferStateHandler = std::function<void(const BufferStateChanged&)>;

    void subscribe(const QueueChangedHandler& handler);
    void subscribe(const StateChangedHandler& handler);
    void subscribe(const StartedHandler& handler);
    void subscribe(const CompletedHandler& handler);
    void subscribe(const PositionHandler& handler);
    void subscribe(const ErrorHandler& handler);
    void subscribe(const BufferStateHandler& handler);

    void publish(const QueueChanged& event) const;
    void publish(const PlaybackStateChanged& event) const;
    void publish(const PassageStarted& event) const;
    void publish(const PassageCompleted& event) const;
    void publish(const PositionUpdate& event) const;
    void publish(const PassageError& event) const;
    void publish(const BufferStateChanged& event) const;

   private:
    template <typename Handler>
    void append(std::vector<Handler>& handlers, const Handler& handler);

    template <typename Event, typename Handler>
    void publishImpl(const Event& event, const std::vector<Handler>& handlers) const;

    mutable std::mutex mutex_;
    std::vector<QueueChangedHandler> queueHandlers_;
    std::vector<StateChangedHandler> stateHandlers_;
    std::vector<StartedHandler> startedHandlers_;
    std::vector<CompletedHandler> completedHandlers_;
    std::vector<PositionHandler> positionHandlers_;
    std::vector<ErrorHandler> errorHandlers_;
    std::vector<BufferStateHandler> bufferHandlers_;
};

inline void PlaybackEvents::subscribe(const QueueChangedHandler& handler) {
    append(queueHandlers_, handler);
}

inline void PlaybackEvents::subscribe(const StateChangedHandler& handler) {
    append(stateHandlers_, handler);
}

inline void PlaybackEvents::subscribe(const StartedHandler& handler) {
    append(startedHandlers_, handler);
}

inline void PlaybackEvents::subscribe(const CompletedHandler& handler) {
    append(completedHandlers_, handler);
}

inline void PlaybackEvents::subscribe(const PositionHandler& handler) {
    append(positionHandlers_, handler);
}

inline void PlaybackEvents::subscribe(const ErrorHandler& handler) {
    append(errorHandlers_, handler);
}

inline void PlaybackEvents::subscribe(const BufferStateHandler& handler) {
    append(bufferHandlers_, handler);
}

inline void PlaybackEvents::publish(const QueueChanged& event) const {
    publishImpl(event, queueHandlers_);
}

inline void PlaybackEvents::publish(const PlaybackStateChanged& event) const {
    publishImpl(event, stateHandlers_);
}

inline void PlaybackEvents::publish(const PassageStarted& event) const {
    publishImpl(event, startedHandlers_);
}

inline void PlaybackEvents::publish(const PassageCompleted& event) const {
    publishImpl(event, completedHandlers_);
}

inline void PlaybackEvents::publish(const PositionUpdate& event) const {
    publishImpl(event, positionHandlers_);
}

inline void PlaybackEvents::publish(const PassageError& event) const {
    publishImpl(event, errorHandlers_);
}

inline void PlaybackEvents::publish(const BufferStateChanged& event) const {
    publishImpl(event, bufferHandlers_);
}

template <typename Handler>
void PlaybackEvents::append(std::vector<Handler>& handlers, const Handler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers.push_back(handler);
}

template <typename Event, typename Handler>
void PlaybackEvents::publishImpl(const Event& event, const std::vector<Handler>& handlers) const {
    std::vector<Handler> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = handlers;
    }
    for (const auto& handler : copy) {
        if (handler) {
            handler(event);
        }
    }
}

}  // namespace playout::events
