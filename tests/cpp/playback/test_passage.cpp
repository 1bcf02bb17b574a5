/**
 * @file test_passage.cpp
 * @brief Unit tests for passage timing validation and derived offsets.
 */

#include "core/timing.h"
#include "playback/passage.h"

#include <gtest/gtest.h>
#include <string>

using namespace playout;

class PassageTest : public ::testing::Test {
   protected:
    // 10 s passage starting 2 s into the file with every point set
    Passage createPassage() {
        Passage passage;
        passage.filePath = "song.flac";
        passage.timing.startTicks = timing::secondsToTicks(2.0);
        passage.timing.endTicks = timing::secondsToTicks(12.0);
        passage.timing.fadeInPointTicks = timing::secondsToTicks(4.0);
        passage.timing.leadInPointTicks = timing::secondsToTicks(3.0);
        passage.timing.leadOutPointTicks = timing::secondsToTicks(11.0);
        passage.timing.fadeOutPointTicks = timing::secondsToTicks(9.0);
        return passage;
    }
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(PassageTest, FullyOrderedPassageIsValid) {
    std::string reason;
    EXPECT_EQ(validatePassage(createPassage(), &reason), ErrorCode::OK);
    EXPECT_TRUE(reason.empty());
}

TEST_F(PassageTest, DefaultPassageIsValid) {
    Passage passage;
    passage.filePath = "a.wav";
    EXPECT_EQ(validatePassage(passage), ErrorCode::OK);
}

TEST_F(PassageTest, NegativeStartIsRejected) {
    Passage passage = createPassage();
    passage.timing.startTicks = -1;
    EXPECT_EQ(validatePassage(passage), ErrorCode::VALIDATION_INVALID_TIMING);
}

TEST_F(PassageTest, EndBeforeStartIsRejected) {
    Passage passage = createPassage();
    passage.timing.endTicks = timing::secondsToTicks(1.0);
    std::string reason;
    EXPECT_EQ(validatePassage(passage, &reason), ErrorCode::VALIDATION_INVALID_TIMING);
    EXPECT_FALSE(reason.empty());
}

TEST_F(PassageTest, FadeInBeforeStartIsRejected) {
    Passage passage = createPassage();
    passage.timing.fadeInPointTicks = timing::secondsToTicks(1.0);
    EXPECT_EQ(validatePassage(passage), ErrorCode::VALIDATION_INVALID_TIMING);
}

TEST_F(PassageTest, FadeOutBeforeFadeInIsRejected) {
    Passage passage = createPassage();
    passage.timing.fadeOutPointTicks = timing::secondsToTicks(3.5);
    std::string reason;
    EXPECT_EQ(validatePassage(passage, &reason), ErrorCode::VALIDATION_INVALID_TIMING);
    EXPECT_NE(reason.find("fade-out point"), std::string::npos);
}

TEST_F(PassageTest, FadeOutAfterEndIsRejected) {
    Passage passage = createPassage();
    passage.timing.fadeOutPointTicks = timing::secondsToTicks(13.0);
    EXPECT_EQ(validatePassage(passage), ErrorCode::VALIDATION_INVALID_TIMING);
}

TEST_F(PassageTest, LeadOutBeforeLeadInIsRejected) {
    Passage passage = createPassage();
    passage.timing.leadOutPointTicks = timing::secondsToTicks(2.5);
    EXPECT_EQ(validatePassage(passage), ErrorCode::VALIDATION_INVALID_TIMING);
}

TEST_F(PassageTest, FadeAndLeadPairsAreIndependent) {
    // Lead-in after the fade-out point is fine: the pairs are not cross-checked
    Passage passage = createPassage();
    passage.timing.leadInPointTicks = timing::secondsToTicks(10.0);
    passage.timing.leadOutPointTicks = timing::secondsToTicks(10.5);
    EXPECT_EQ(validatePassage(passage), ErrorCode::OK);
}

TEST_F(PassageTest, OpenEndedPassageSkipsEndChecks) {
    Passage passage = createPassage();
    passage.timing.endTicks.reset();
    passage.timing.fadeOutPointTicks = timing::secondsToTicks(600.0);
    EXPECT_EQ(validatePassage(passage), ErrorCode::OK);
}

// ============================================================================
// Derived values
// ============================================================================

TEST_F(PassageTest, ResolveEndPrefersExplicitEnd) {
    Passage passage = createPassage();
    auto end = resolveEndTicks(passage.timing, timing::secondsToTicks(30.0));
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, timing::secondsToTicks(12.0));
}

TEST_F(PassageTest, ResolveEndFallsBackToDiscovered) {
    Passage passage = createPassage();
    passage.timing.endTicks.reset();
    auto end = resolveEndTicks(passage.timing, timing::secondsToTicks(30.0));
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, timing::secondsToTicks(30.0));

    // A discovered end at or before the start is useless
    EXPECT_FALSE(resolveEndTicks(passage.timing, timing::secondsToTicks(1.0)).has_value());
    EXPECT_FALSE(resolveEndTicks(passage.timing, std::nullopt).has_value());
}

TEST_F(PassageTest, CrossfadeOffsetIsRelativeToStart) {
    Passage passage = createPassage();
    auto offset = crossfadeStartOffsetTicks(passage.timing);
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, timing::secondsToTicks(7.0));
}

TEST_F(PassageTest, NoFadeOutMeansNoCrossfade) {
    Passage passage = createPassage();
    passage.timing.fadeOutPointTicks.reset();
    EXPECT_FALSE(crossfadeStartOffsetTicks(passage.timing).has_value());

    passage.timing.fadeOutPointTicks = passage.timing.endTicks;
    EXPECT_FALSE(crossfadeStartOffsetTicks(passage.timing).has_value());
}
