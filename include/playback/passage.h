#ifndef PASSAGE_H
#define PASSAGE_H

#include "audio/fade_curve.h"
#include "core/error_codes.h"

#include <cstdint>
#include <optional>
#include <string>

namespace playout {

// Queue entry identifier handed out by the engine. 0 is never issued.
using PassageId = uint64_t;

constexpr PassageId kInvalidPassageId = 0;

/**
 * @brief Six timing markers of a passage, all in ticks on the file timeline.
 *
 * Fade points bound the audible gain curve:
 *   fade-in  runs from startTicks to fadeInPointTicks,
 *   fade-out runs from fadeOutPointTicks to the passage end.
 * Lead points mark where the musical content begins and ends. The two pairs
 * are independent and validated separately.
 */
struct PassageTiming {
    int64_t startTicks = 0;
    std::optional<int64_t> endTicks;  // nullopt = play to end of file
    int64_t fadeInPointTicks = 0;     // == startTicks means no fade-in
    int64_t leadInPointTicks = 0;
    std::optional<int64_t> leadOutPointTicks;  // nullopt = passage end
    std::optional<int64_t> fadeOutPointTicks;  // nullopt = no fade-out
};

struct Passage {
    std::string filePath;
    PassageTiming timing;
    FadeCurve fadeInCurve = FadeCurve::Exponential;
    FadeCurve fadeOutCurve = FadeCurve::Logarithmic;
};

/**
 * @brief Check the ordering constraints of a passage's timing points.
 *
 * start <= fadeInPoint <= fadeOutPoint <= end and
 * start <= leadInPoint <= leadOutPoint <= end, with unset optional points
 * skipped. All points must be non-negative.
 *
 * @param reason Receives a human-readable description on failure (optional)
 * @return ErrorCode::OK or VALIDATION_INVALID_TIMING
 */
ErrorCode validatePassage(const Passage& passage, std::string* reason = nullptr);

/**
 * @brief Passage end, falling back to the decoder-discovered end.
 *
 * discoveredEndTicks is on the same file timeline as startTicks.
 */
std::optional<int64_t> resolveEndTicks(const PassageTiming& timing,
                                       std::optional<int64_t> discoveredEndTicks);

/**
 * @brief Offset from passage start at which the next passage may start
 *        overlapping this one, or nullopt when it should wait for exhaustion.
 */
std::optional<int64_t> crossfadeStartOffsetTicks(const PassageTiming& timing);

}  // namespace playout

#endif  // PASSAGE_H
