#ifndef DECODER_WORKER_H
#define DECODER_WORKER_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "playback/decoder_chain.h"
#include "playback/passage.h"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace playout {

// Lower value is served first.
enum class DecodePriority {
    Immediate = 0,  // passage being played
    Next = 1,       // passage that plays after it
    Prefetch = 2    // anything further down the queue
};

const char* decodePriorityToString(DecodePriority priority);

enum class ChainState { Active, Yielded, Finished, Errored };

const char* chainStateToString(ChainState state);

// Builds the chain for a passage when the worker decides to start it.
// Returning nullptr with error set reports a start failure.
using ChainFactory = std::function<std::unique_ptr<DecoderChain>(PassageId id, InnerError& error)>;

struct ChainFailure {
    PassageId id = kInvalidPassageId;
    InnerError error;
};

// Outcome of one scheduling iteration.
struct IterationResult {
    std::vector<PassageId> resumed;
    std::vector<PassageId> started;
    std::optional<PassageId> processed;  // chain that ran advance()
    ProcessStatus status = ProcessStatus::Processed;
    size_t framesPushed = 0;
    std::vector<ChainFailure> failures;

    bool didWork() const {
        return processed.has_value() || !started.empty() || !failures.empty();
    }
};

/**
 * @brief Cooperative scheduler running one decoder chain step at a time.
 *
 * Chains are owned here, keyed by passage id. iterate() performs the resume
 * scan, starts chains for waiting passages while fewer than
 * maximumDecodeStreams chains hold buffers, advances exactly one Active chain
 * and yields it on BufferFull. A chain that fails is destroyed on the spot and
 * its entry parked as Errored, outside every scheduling set, until remove().
 *
 * Not thread-safe: the owner serializes iterate() against submit()/remove().
 */
class DecoderWorker {
   public:
    explicit DecoderWorker(const EngineConfig& config, ChainFactory factory = nullptr);

    void setChainFactory(ChainFactory factory);

    // Queue a passage for decoding. Returns QUEUE_DUPLICATE_ENTRY if the id
    // is already waiting or has a chain.
    ErrorCode submit(PassageId id, DecodePriority priority);

    // Drop the passage: waiting entry or chain (decoder, resampler, fader
    // state and the chain's buffer reference). WORKER_CHAIN_NOT_FOUND when
    // unknown.
    ErrorCode remove(PassageId id);

    ErrorCode setPriority(PassageId id, DecodePriority priority);

    IterationResult iterate();

    std::optional<ChainState> stateOf(PassageId id) const;
    std::optional<DecodePriority> priorityOf(PassageId id) const;
    bool isWaiting(PassageId id) const;

    // Chains counted against maximumDecodeStreams (Active, Yielded or Finished).
    size_t chainCount() const;
    size_t waitingCount() const {
        return waiting_.size();
    }
    std::vector<PassageId> chainsIn(ChainState state) const;

   private:
    struct ChainEntry {
        std::unique_ptr<DecoderChain> chain;
        ChainState state = ChainState::Active;
        DecodePriority priority = DecodePriority::Prefetch;
    };

    struct WaitingEntry {
        PassageId id = kInvalidPassageId;
        DecodePriority priority = DecodePriority::Prefetch;
    };

    void resumeScan(IterationResult& result);
    void startChains(IterationResult& result);
    void processOne(IterationResult& result);

    // Best priority class among Active chains, round-robin inside it.
    std::optional<PassageId> selectActive() const;

    size_t maximumDecodeStreams_;
    ChainFactory factory_;

    std::map<PassageId, ChainEntry> chains_;
    std::vector<WaitingEntry> waiting_;  // submit order
    PassageId lastServed_ = kInvalidPassageId;
};

}  // namespace playout

#endif  // DECODER_WORKER_H
