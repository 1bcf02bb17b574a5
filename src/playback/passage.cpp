#include "playback/passage.h"

#include <sstream>

namespace playout {

namespace {

bool fail(std::string* reason, const std::string& message) {
    if (reason) {
        *reason = message;
    }
    return false;
}

bool checkOrder(int64_t earlier, int64_t later, const char* earlierName, const char* laterName,
                std::string* reason) {
    if (earlier <= later) {
        return true;
    }
    std::ostringstream oss;
    oss << earlierName << " (" << earlier << ") is after " << laterName << " (" << later << ")";
    return fail(reason, oss.str());
}

}  // namespace

ErrorCode validatePassage(const Passage& passage, std::string* reason) {
    const PassageTiming& t = passage.timing;

    if (t.startTicks < 0) {
        fail(reason, "start is negative");
        return ErrorCode::VALIDATION_INVALID_TIMING;
    }

    // Upper bound for the optional points; unset end means "file end".
    const bool hasEnd = t.endTicks.has_value();
    const int64_t end = hasEnd ? *t.endTicks : INT64_MAX;
    if (hasEnd && end <= t.startTicks) {
        fail(reason, "end must be after start");
        return ErrorCode::VALIDATION_INVALID_TIMING;
    }

    // Fade pair
    if (!checkOrder(t.startTicks, t.fadeInPointTicks, "start", "fade-in point", reason) ||
        !checkOrder(t.fadeInPointTicks, end, "fade-in point", "end", reason)) {
        return ErrorCode::VALIDATION_INVALID_TIMING;
    }
    if (t.fadeOutPointTicks) {
        if (!checkOrder(t.fadeInPointTicks, *t.fadeOutPointTicks, "fade-in point",
                        "fade-out point", reason) ||
            !checkOrder(*t.fadeOutPointTicks, end, "fade-out point", "end", reason)) {
            return ErrorCode::VALIDATION_INVALID_TIMING;
        }
    }

    // Lead pair
    if (!checkOrder(t.startTicks, t.leadInPointTicks, "start", "lead-in point", reason) ||
        !checkOrder(t.leadInPointTicks, end, "lead-in point", "end", reason)) {
        return ErrorCode::VALIDATION_INVALID_TIMING;
    }
    if (t.leadOutPointTicks) {
        if (!checkOrder(t.leadInPointTicks, *t.leadOutPointTicks, "lead-in point",
                        "lead-out point", reason) ||
            !checkOrder(*t.leadOutPointTicks, end, "lead-out point", "end", reason)) {
            return ErrorCode::VALIDATION_INVALID_TIMING;
        }
    }

    return ErrorCode::OK;
}

std::optional<int64_t> resolveEndTicks(const PassageTiming& timing,
                                       std::optional<int64_t> discoveredEndTicks) {
    if (timing.endTicks) {
        return timing.endTicks;
    }
    if (discoveredEndTicks && *discoveredEndTicks > timing.startTicks) {
        return discoveredEndTicks;
    }
    return std::nullopt;
}

std::optional<int64_t> crossfadeStartOffsetTicks(const PassageTiming& timing) {
    if (!timing.fadeOutPointTicks) {
        return std::nullopt;
    }
    if (timing.endTicks && *timing.fadeOutPointTicks >= *timing.endTicks) {
        return std::nullopt;
    }
    return *timing.fadeOutPointTicks - timing.startTicks;
}

}  // namespace playout
