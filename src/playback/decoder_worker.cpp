#include "playback/decoder_worker.h"

#include "logging/logger.h"

#include <algorithm>

namespace playout {

const char* decodePriorityToString(DecodePriority priority) {
    switch (priority) {
    case DecodePriority::Immediate:
        return "immediate";
    case DecodePriority::Next:
        return "next";
    case DecodePriority::Prefetch:
    default:
        return "prefetch";
    }
}

const char* chainStateToString(ChainState state) {
    switch (state) {
    case ChainState::Active:
        return "active";
    case ChainState::Yielded:
        return "yielded";
    case ChainState::Finished:
        return "finished";
    case ChainState::Errored:
    default:
        return "errored";
    }
}

DecoderWorker::DecoderWorker(const EngineConfig& config, ChainFactory factory)
    : maximumDecodeStreams_(std::max<size_t>(config.maximumDecodeStreams, 1)),
      factory_(std::move(factory)) {}

void DecoderWorker::setChainFactory(ChainFactory factory) {
    factory_ = std::move(factory);
}

ErrorCode DecoderWorker::submit(PassageId id, DecodePriority priority) {
    if (id == kInvalidPassageId) {
        return ErrorCode::QUEUE_ENTRY_NOT_FOUND;
    }
    if (chains_.count(id) > 0 || isWaiting(id)) {
        return ErrorCode::QUEUE_DUPLICATE_ENTRY;
    }
    waiting_.push_back(WaitingEntry{id, priority});
    LOG_TRACE("Worker: passage {} waiting ({})", id, decodePriorityToString(priority));
    return ErrorCode::OK;
}

ErrorCode DecoderWorker::remove(PassageId id) {
    auto waitingIt = std::find_if(waiting_.begin(), waiting_.end(),
                                  [id](const WaitingEntry& entry) { return entry.id == id; });
    if (waitingIt != waiting_.end()) {
        waiting_.erase(waitingIt);
        return ErrorCode::OK;
    }

    auto it = chains_.find(id);
    if (it == chains_.end()) {
        return ErrorCode::WORKER_CHAIN_NOT_FOUND;
    }
    LOG_DEBUG("Worker: tearing down chain {} ({})", id, chainStateToString(it->second.state));
    chains_.erase(it);
    if (lastServed_ == id) {
        lastServed_ = kInvalidPassageId;
    }
    return ErrorCode::OK;
}

ErrorCode DecoderWorker::setPriority(PassageId id, DecodePriority priority) {
    auto it = chains_.find(id);
    if (it != chains_.end()) {
        it->second.priority = priority;
        return ErrorCode::OK;
    }
    for (auto& entry : waiting_) {
        if (entry.id == id) {
            entry.priority = priority;
            return ErrorCode::OK;
        }
    }
    return ErrorCode::WORKER_CHAIN_NOT_FOUND;
}

IterationResult DecoderWorker::iterate() {
    IterationResult result;
    resumeScan(result);
    startChains(result);
    processOne(result);
    return result;
}

void DecoderWorker::resumeScan(IterationResult& result) {
    for (auto& [id, entry] : chains_) {
        if (entry.state != ChainState::Yielded || !entry.chain) {
            continue;
        }
        const auto& buffer = entry.chain->buffer();
        if (Backpressure::shouldResume(buffer->freeSpace(), entry.chain->marks())) {
            entry.state = ChainState::Active;
            result.resumed.push_back(id);
            LOG_DEBUG("Worker: chain {} resumed (free {} frames)", id, buffer->freeSpace());
        }
    }
}

void DecoderWorker::startChains(IterationResult& result) {
    while (!waiting_.empty() && chainCount() < maximumDecodeStreams_) {
        if (!factory_) {
            LOG_ONCE(WARN, "Worker: no chain factory set, passages stay waiting");
            return;
        }

        // Best priority first, submit order within a class
        auto best = std::min_element(waiting_.begin(), waiting_.end(),
                                     [](const WaitingEntry& a, const WaitingEntry& b) {
                                         return static_cast<int>(a.priority) <
                                                static_cast<int>(b.priority);
                                     });
        WaitingEntry waiting = *best;
        waiting_.erase(best);

        InnerError error;
        std::unique_ptr<DecoderChain> chain = factory_(waiting.id, error);

        ChainEntry entry;
        entry.priority = waiting.priority;
        if (!chain) {
            if (error.code == ErrorCode::OK) {
                error = InnerError(ErrorCode::INTERNAL_UNKNOWN, "Chain factory returned nothing");
            }
            entry.state = ChainState::Errored;
            chains_[waiting.id] = std::move(entry);
            result.failures.push_back(ChainFailure{waiting.id, error});
            LOG_ERROR("Worker: cannot start passage {}: {} ({})", waiting.id,
                      errorCodeToString(error.code), error.cpp_message);
            continue;
        }

        entry.chain = std::move(chain);
        entry.state = ChainState::Active;
        chains_[waiting.id] = std::move(entry);
        result.started.push_back(waiting.id);
        LOG_DEBUG("Worker: chain {} started ({})", waiting.id,
                  decodePriorityToString(waiting.priority));
    }
}

void DecoderWorker::processOne(IterationResult& result) {
    std::optional<PassageId> selected = selectActive();
    if (!selected) {
        return;
    }

    ChainEntry& entry = chains_[*selected];
    ProcessResult processed = entry.chain->advance();
    lastServed_ = *selected;

    result.processed = *selected;
    result.status = processed.status;
    result.framesPushed = processed.framesPushed;

    switch (processed.status) {
    case ProcessStatus::Processed:
        LOG_TRACE("Worker: chain {} pushed {} frames", *selected, processed.framesPushed);
        break;
    case ProcessStatus::BufferFull:
        entry.state = ChainState::Yielded;
        LOG_DEBUG("Worker: chain {} yielded after {} frames (buffer full)", *selected,
                  processed.framesPushed);
        break;
    case ProcessStatus::Finished:
        entry.state = ChainState::Finished;
        LOG_DEBUG("Worker: chain {} finished ({} frames total)", *selected,
                  processed.totalFrames);
        break;
    case ProcessStatus::Failed:
        // Out of every scheduling set; the buffer handle goes with the chain.
        entry.state = ChainState::Errored;
        entry.chain.reset();
        result.failures.push_back(ChainFailure{*selected, processed.error});
        break;
    }
}

std::optional<PassageId> DecoderWorker::selectActive() const {
    std::optional<DecodePriority> bestClass;
    for (const auto& [id, entry] : chains_) {
        if (entry.state == ChainState::Active && entry.chain) {
            if (!bestClass || static_cast<int>(entry.priority) < static_cast<int>(*bestClass)) {
                bestClass = entry.priority;
            }
        }
    }
    if (!bestClass) {
        return std::nullopt;
    }

    std::optional<PassageId> first;
    for (const auto& [id, entry] : chains_) {
        if (entry.state != ChainState::Active || !entry.chain || entry.priority != *bestClass) {
            continue;
        }
        if (!first) {
            first = id;
        }
        if (id > lastServed_) {
            return id;
        }
    }
    return first;
}

std::optional<ChainState> DecoderWorker::stateOf(PassageId id) const {
    auto it = chains_.find(id);
    if (it == chains_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::optional<DecodePriority> DecoderWorker::priorityOf(PassageId id) const {
    auto it = chains_.find(id);
    if (it != chains_.end()) {
        return it->second.priority;
    }
    for (const auto& entry : waiting_) {
        if (entry.id == id) {
            return entry.priority;
        }
    }
    return std::nullopt;
}

bool DecoderWorker::isWaiting(PassageId id) const {
    return std::any_of(waiting_.begin(), waiting_.end(),
                       [id](const WaitingEntry& entry) { return entry.id == id; });
}

size_t DecoderWorker::chainCount() const {
    return static_cast<size_t>(
        std::count_if(chains_.begin(), chains_.end(),
                      [](const auto& item) { return item.second.state != ChainState::Errored; }));
}

std::vector<PassageId> DecoderWorker::chainsIn(ChainState state) const {
    std::vector<PassageId> ids;
    for (const auto& [id, entry] : chains_) {
        if (entry.state == state) {
            ids.push_back(id);
        }
    }
    return ids;
}

}  // namespace playout
