#include "playback/playback_engine.h"

#include "audio/audio_io.h"
#include "core/timing.h"
#include "logging/logger.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <new>

namespace playout {

std::unique_ptr<Decoder> openSndfileDecoder(const Passage& passage, const EngineConfig& config,
                                            InnerError& error) {
    std::error_code ec;
    if (!std::filesystem::exists(passage.filePath, ec)) {
        error = InnerError(ErrorCode::VALIDATION_FILE_NOT_FOUND,
                           "File not found: " + passage.filePath);
        return nullptr;
    }

    auto decoder = std::make_unique<SndfileDecoder>(passage.filePath, passage.timing.startTicks,
                                                    passage.timing.endTicks, config.decodeChunkMs);
    if (!decoder->open(error)) {
        return nullptr;
    }
    return decoder;
}

PlaybackEngine::PlaybackEngine(const EngineConfig& config, DecoderFactory decoderFactory)
    : config_(config),
      readyFrames_(Backpressure::readyFrames(config)),
      decoderFactory_(std::move(decoderFactory)),
      mixer_(config),
      worker_(config) {
    std::string reason;
    if (validateEngineConfig(config_, &reason) != ErrorCode::OK) {
        LOG_WARN("Engine: configuration problem: {}", reason);
    }
    worker_.setChainFactory(
        [this](PassageId id, InnerError& error) { return createChain(id, error); });
    mixerEvents_.reserve(Mixer::kEventCapacity);

    LOG_INFO("Engine: {} Hz working rate, {} frame buffers ({} to start), {} decode streams",
             config_.workingSampleRate, config_.bufferCapacityFrames, readyFrames_,
             config_.maximumDecodeStreams);
}

PlaybackEngine::~PlaybackEngine() {
    std::lock_guard<std::mutex> lock(engineMutex_);
    mixer_.clearSources();
}

ErrorCode PlaybackEngine::enqueue(const Passage& passage, PassageId* outId) {
    std::string reason;
    ErrorCode code = validatePassage(passage, &reason);
    if (code != ErrorCode::OK) {
        LOG_WARN("Engine: rejected passage {}: {}", passage.filePath, reason);
        return code;
    }

    std::vector<PendingEvent> pending;
    PassageId id = kInvalidPassageId;
    {
        std::lock_guard<std::mutex> lock(engineMutex_);
        id = nextId_++;
        Entry entry;
        entry.id = id;
        entry.passage = passage;
        queue_.push_back(std::move(entry));

        code = worker_.submit(id, priorityForIndex(queue_.size() - 1));
        if (code != ErrorCode::OK) {
            queue_.pop_back();
            return code;
        }
        pending.push_back(events::QueueChanged{queue_.size()});
    }

    LOG_INFO("Engine: enqueued passage {} ({})", id, passage.filePath);
    publish(pending);
    if (outId) {
        *outId = id;
    }
    return ErrorCode::OK;
}

ErrorCode PlaybackEngine::remove(PassageId id) {
    std::vector<PendingEvent> pending;
    ErrorCode code;
    {
        std::lock_guard<std::mutex> lock(engineMutex_);
        code = removeLocked(id, true, false, pending);
    }
    publish(pending);
    return code;
}

ErrorCode PlaybackEngine::skip() {
    std::vector<PendingEvent> pending;
    ErrorCode code;
    {
        std::lock_guard<std::mutex> lock(engineMutex_);
        PassageId target = mixer_.currentPassage();
        if (target == kInvalidPassageId) {
            if (queue_.empty()) {
                return ErrorCode::QUEUE_ENTRY_NOT_FOUND;
            }
            target = queue_.front().id;
        }
        code = removeLocked(target, true, true, pending);
    }
    publish(pending);
    return code;
}

void PlaybackEngine::clear() {
    std::vector<PendingEvent> pending;
    {
        std::lock_guard<std::mutex> lock(engineMutex_);
        if (queue_.empty()) {
            return;
        }
        mixer_.clearSources();
        for (auto& entry : queue_) {
            ErrorCode code = worker_.remove(entry.id);
            if (code != ErrorCode::OK) {
                LOG_DEBUG("Engine: passage {} had no worker entry ({})", entry.id,
                          errorCodeToString(code));
            }
            retire(std::move(entry.buffer));
        }
        queue_.clear();
        pending.push_back(events::QueueChanged{0});
    }
    LOG_INFO("Engine: queue cleared");
    publish(pending);
}

void PlaybackEngine::play() {
    {
        std::lock_guard<std::mutex> lock(engineMutex_);
        if (mixer_.state() == PlaybackState::Playing) {
            return;
        }
        mixer_.play();
    }
    LOG_INFO("Engine: playing");
    publish({events::PlaybackStateChanged{PlaybackState::Playing}});
}

void PlaybackEngine::pause() {
    {
        std::lock_guard<std::mutex> lock(engineMutex_);
        if (mixer_.state() == PlaybackState::Paused) {
            return;
        }
        mixer_.pause();
    }
    LOG_INFO("Engine: paused");
    publish({events::PlaybackStateChanged{PlaybackState::Paused}});
}

PlaybackState PlaybackEngine::state() const {
    return mixer_.state();
}

bool PlaybackEngine::tick() {
    std::vector<PendingEvent> pending;
    bool worked = false;
    {
        std::lock_guard<std::mutex> lock(engineMutex_);
        handleMixerEvents(pending);
        releaseRetired();
        updatePriorities();

        IterationResult result = worker_.iterate();
        handleFailures(result, pending);
        updateBufferStates(pending);

        syncMixer();
        collectPosition(pending);
        worked = result.didWork();
    }
    publish(pending);
    return worked;
}

void PlaybackEngine::mix(float* output, size_t frames) {
    mixer_.mix(output, frames);
}

std::vector<float> PlaybackEngine::mix(size_t frames) {
    return mixer_.mix(frames);
}

void PlaybackEngine::setMasterVolume(float volume) {
    mixer_.setMasterVolume(volume);
}

float PlaybackEngine::masterVolume() const {
    return mixer_.masterVolume();
}

std::vector<QueueEntry> PlaybackEngine::queueSnapshot() const {
    std::lock_guard<std::mutex> lock(engineMutex_);
    std::vector<QueueEntry> snapshot;
    snapshot.reserve(queue_.size());
    for (const auto& entry : queue_) {
        snapshot.push_back(QueueEntry{entry.id, entry.passage});
    }
    return snapshot;
}

size_t PlaybackEngine::queueLength() const {
    std::lock_guard<std::mutex> lock(engineMutex_);
    return queue_.size();
}

PassageId PlaybackEngine::currentPassage() const {
    return mixer_.currentPassage();
}

int64_t PlaybackEngine::positionTicks() const {
    return mixer_.positionTicks();
}

std::optional<ChainState> PlaybackEngine::chainState(PassageId id) const {
    std::lock_guard<std::mutex> lock(engineMutex_);
    return worker_.stateOf(id);
}

std::optional<BufferState> PlaybackEngine::bufferState(PassageId id) const {
    std::lock_guard<std::mutex> lock(engineMutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [id](const Entry& entry) { return entry.id == id; });
    if (it == queue_.end() || !it->buffer) {
        return std::nullopt;
    }
    return it->bufferState;
}

std::unique_ptr<DecoderChain> PlaybackEngine::createChain(PassageId id, InnerError& error) {
    Entry* entry = find(id);
    if (!entry) {
        error = InnerError(ErrorCode::QUEUE_ENTRY_NOT_FOUND,
                           "Passage " + std::to_string(id) + " is no longer queued");
        return nullptr;
    }

    try {
        // The buffer exists even if the decoder fails, so the passage can
        // drain and complete like any other.
        entry->buffer = std::make_shared<PlayoutRingBuffer>(config_.bufferCapacityFrames);
    } catch (const std::bad_alloc&) {
        error = InnerError(ErrorCode::BUFFER_NOT_ALLOCATED,
                           "Cannot allocate " + std::to_string(config_.bufferCapacityFrames) +
                               " frame buffer");
        return nullptr;
    }

    std::unique_ptr<Decoder> decoder;
    try {
        decoder = decoderFactory_(entry->passage, config_, error);
    } catch (const std::exception& e) {
        error = InnerError(ErrorCode::DECODE_FAILED, std::string("Decoder factory threw: ") +
                                                         e.what());
        return nullptr;
    }
    if (!decoder) {
        if (error.code == ErrorCode::OK) {
            error = InnerError(ErrorCode::IO_OPEN_FAILED, "Cannot open " + entry->passage.filePath);
        }
        return nullptr;
    }

    return std::make_unique<DecoderChain>(id, entry->passage, std::move(decoder), entry->buffer,
                                          config_);
}

void PlaybackEngine::handleMixerEvents(std::vector<PendingEvent>& pending) {
    mixerEvents_.clear();
    mixer_.drainEvents(mixerEvents_);
    for (const auto& event : mixerEvents_) {
        if (event.type == MixerEvent::Type::Started) {
            LOG_INFO("Engine: passage {} started", event.id);
            pending.push_back(events::PassageStarted{event.id});
            if (Entry* entry = find(event.id)) {
                setBufferState(*entry, BufferState::Playing, pending);
            }
            continue;
        }
        LOG_INFO("Engine: passage {} completed", event.id);
        ErrorCode code = removeLocked(event.id, false, true, pending);
        if (code != ErrorCode::OK) {
            LOG_DEBUG("Engine: completed passage {} already removed", event.id);
        }
    }
}

void PlaybackEngine::handleFailures(const IterationResult& result,
                                    std::vector<PendingEvent>& pending) {
    for (const auto& failure : result.failures) {
        Entry* entry = find(failure.id);
        if (!entry) {
            continue;
        }
        if (entry->buffer) {
            // Let already-decoded audio play out; the mixer completes it.
            entry->buffer->markFinished();
        }
        if (!entry->errorReported) {
            entry->errorReported = true;
            pending.push_back(events::PassageError{failure.id, failure.error});
        }
        if (!entry->buffer) {
            // Nothing to drain
            ErrorCode code = removeLocked(failure.id, true, true, pending);
            if (code != ErrorCode::OK) {
                LOG_DEBUG("Engine: failed passage {} already removed", failure.id);
            }
        }
    }
}

void PlaybackEngine::updatePriorities() {
    // The following passage shares the Immediate class while the playing one
    // has its minimum buffered and the following one does not.
    bool catchUp = false;
    if (queue_.size() > 1) {
        const auto& head = queue_[0].buffer;
        const auto& following = queue_[1].buffer;
        const bool headCovered =
            head && (head->isFinished() || head->len() >= readyFrames_);
        const bool followingShort =
            !following || (!following->isFinished() && following->len() < readyFrames_);
        catchUp = headCovered && followingShort;
    }

    for (size_t i = 0; i < queue_.size(); ++i) {
        const DecodePriority wanted =
            (i == 1 && catchUp) ? DecodePriority::Immediate : priorityForIndex(i);
        if (worker_.priorityOf(queue_[i].id) == wanted) {
            continue;
        }
        ErrorCode code = worker_.setPriority(queue_[i].id, wanted);
        if (code != ErrorCode::OK) {
            LOG_WARN("Engine: cannot set priority of passage {}: {}", queue_[i].id,
                     errorCodeToString(code));
        }
    }
}

void PlaybackEngine::updateBufferStates(std::vector<PendingEvent>& pending) {
    for (auto& entry : queue_) {
        if (!entry.buffer || entry.decodeFinished) {
            continue;
        }
        const uint64_t pushed = entry.buffer->totalFramesPushed();
        if (entry.bufferState == BufferState::Empty && pushed > 0) {
            setBufferState(entry, BufferState::Filling, pending);
        }
        if (entry.bufferState == BufferState::Filling && pushed >= readyFrames_) {
            setBufferState(entry, BufferState::Ready, pending);
        }
        if (entry.buffer->isFinished()) {
            entry.decodeFinished = true;
            setBufferState(entry, BufferState::Finished, pending);
        }
    }
}

void PlaybackEngine::setBufferState(Entry& entry, BufferState state,
                                    std::vector<PendingEvent>& pending) {
    if (entry.bufferState == state) {
        return;
    }
    const uint64_t pushed = entry.buffer ? entry.buffer->totalFramesPushed() : 0;
    LOG_DEBUG("Engine: buffer {} {} -> {} ({} frames)", entry.id,
              bufferStateToString(entry.bufferState), bufferStateToString(state), pushed);
    pending.push_back(events::BufferStateChanged{entry.id, entry.bufferState, state, pushed});
    entry.bufferState = state;
}

void PlaybackEngine::syncMixer() {
    if (queue_.empty()) {
        return;
    }

    PassageId current = mixer_.currentPassage();
    if (current == kInvalidPassageId && mixer_.nextPassage() == kInvalidPassageId) {
        const Entry& head = queue_.front();
        if (isReady(head) && mixer_.setCurrentIfIdle(head.id, head.buffer,
                                                   crossfadeStartOffsetTicks(head.passage.timing))) {
            LOG_DEBUG("Engine: passage {} is current", head.id);
        }
        current = mixer_.currentPassage();
    }

    if (current == kInvalidPassageId || mixer_.nextPassage() != kInvalidPassageId) {
        return;
    }

    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [current](const Entry& entry) { return entry.id == current; });
    if (it == queue_.end() || std::next(it) == queue_.end()) {
        return;
    }
    const Entry& following = *std::next(it);
    if (isReady(following) &&
        mixer_.armNext(current, following.id, following.buffer,
                       crossfadeStartOffsetTicks(following.passage.timing))) {
        LOG_DEBUG("Engine: passage {} armed after {}", following.id, current);
    }
}

void PlaybackEngine::collectPosition(std::vector<PendingEvent>& pending) {
    if (config_.positionUpdateIntervalMs == 0) {
        return;
    }
    const PassageId current = mixer_.currentPassage();
    if (current == kInvalidPassageId) {
        return;
    }
    if (current != positionPassage_) {
        positionPassage_ = current;
        lastPositionFrames_ = 0;
    }

    const uint64_t intervalFrames =
        static_cast<uint64_t>(config_.positionUpdateIntervalMs) * config_.workingSampleRate / 1000;
    const uint64_t position = mixer_.positionFrames();
    if (intervalFrames > 0 && position >= lastPositionFrames_ + intervalFrames) {
        lastPositionFrames_ = position;
        pending.push_back(events::PositionUpdate{
            current, timing::samplesToTicks(static_cast<size_t>(position),
                                            config_.workingSampleRate)});
    }
}

ErrorCode PlaybackEngine::removeLocked(PassageId id, bool skipped, bool announce,
                                       std::vector<PendingEvent>& pending) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [id](const Entry& entry) { return entry.id == id; });
    if (it == queue_.end()) {
        return ErrorCode::QUEUE_ENTRY_NOT_FOUND;
    }

    if (mixer_.removeSource(id)) {
        LOG_DEBUG("Engine: passage {} detached from mixer", id);
    }
    ErrorCode code = worker_.remove(id);
    if (code != ErrorCode::OK) {
        LOG_DEBUG("Engine: passage {} had no worker entry ({})", id, errorCodeToString(code));
    }
    // Buffer memory is released on the control thread, once no block in
    // flight can still read it.
    retire(std::move(it->buffer));
    queue_.erase(it);
    if (positionPassage_ == id) {
        positionPassage_ = kInvalidPassageId;
    }

    if (announce) {
        pending.push_back(events::PassageCompleted{id, skipped});
    }
    pending.push_back(events::QueueChanged{queue_.size()});
    return ErrorCode::OK;
}

void PlaybackEngine::retire(std::shared_ptr<PlayoutRingBuffer> buffer) {
    if (buffer) {
        retired_.push_back(RetiredBuffer{mixer_.mixesStarted(), std::move(buffer)});
    }
}

void PlaybackEngine::releaseRetired() {
    const uint64_t completed = mixer_.mixesCompleted();
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [completed](const RetiredBuffer& retired) {
                                      return retired.mixEpoch <= completed;
                                  }),
                   retired_.end());
}

void PlaybackEngine::publish(const std::vector<PendingEvent>& pending) {
    for (const auto& event : pending) {
        std::visit([this](const auto& e) { events_.publish(e); }, event);
    }
}

PlaybackEngine::Entry* PlaybackEngine::find(PassageId id) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [id](const Entry& entry) { return entry.id == id; });
    return it == queue_.end() ? nullptr : &*it;
}

bool PlaybackEngine::isReady(const Entry& entry) const {
    return entry.buffer && isPlayable(entry.bufferState);
}

DecodePriority PlaybackEngine::priorityForIndex(size_t index) {
    if (index == 0) {
        return DecodePriority::Immediate;
    }
    if (index == 1) {
        return DecodePriority::Next;
    }
    return DecodePriority::Prefetch;
}

}  // namespace playout
