/**
 * @file test_fader.cpp
 * @brief Unit tests for the per-passage fader (tick-accurate gain curves).
 */

#include "audio/fader.h"
#include "core/timing.h"
#include "playback/passage.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <vector>

using namespace playout;

namespace {

constexpr uint32_t kRate = 8000;
constexpr int64_t kTicksPerFrame = 3528;  // 8 kHz

int64_t frameTicks(int64_t frame) {
    return frame * kTicksPerFrame;
}

}  // namespace

class FaderTest : public ::testing::Test {
   protected:
    std::vector<float> createTestBuffer(size_t frames, float value = 1.0f) {
        return std::vector<float>(frames * 2, value);
    }

    // 1 s fade-in, fade-out over the last second of a 4 s passage
    Passage createPassage() {
        Passage passage;
        passage.filePath = "tone.wav";
        passage.timing.startTicks = 0;
        passage.timing.endTicks = timing::secondsToTicks(4.0);
        passage.timing.fadeInPointTicks = timing::secondsToTicks(1.0);
        passage.timing.fadeOutPointTicks = timing::secondsToTicks(3.0);
        passage.fadeInCurve = FadeCurve::Linear;
        passage.fadeOutCurve = FadeCurve::Linear;
        return passage;
    }
};

// ============================================================================
// Region construction
// ============================================================================

TEST_F(FaderTest, RegionsFromPassage) {
    Fader fader = Fader::forPassage(createPassage(), std::nullopt, kRate);
    const FadeRegions& regions = fader.regions();
    EXPECT_EQ(regions.fadeInStartTicks, 0);
    EXPECT_EQ(regions.fadeInEndTicks, timing::secondsToTicks(1.0));
    EXPECT_TRUE(regions.hasFadeOut);
    EXPECT_EQ(regions.fadeOutStartTicks, timing::secondsToTicks(3.0));
    EXPECT_EQ(regions.fadeOutEndTicks, timing::secondsToTicks(4.0));
    EXPECT_FALSE(fader.isPassThrough());
    EXPECT_EQ(fader.ticksPerFrame(), kTicksPerFrame);
}

TEST_F(FaderTest, DiscoveredEndClosesFadeOut) {
    Passage passage = createPassage();
    passage.timing.endTicks.reset();
    Fader fader = Fader::forPassage(passage, timing::secondsToTicks(5.0), kRate);
    EXPECT_TRUE(fader.regions().hasFadeOut);
    EXPECT_EQ(fader.regions().fadeOutEndTicks, timing::secondsToTicks(5.0));
}

TEST_F(FaderTest, UnknownEndDisablesFadeOut) {
    Passage passage = createPassage();
    passage.timing.endTicks.reset();
    Fader fader = Fader::forPassage(passage, std::nullopt, kRate);
    EXPECT_FALSE(fader.regions().hasFadeOut);
    EXPECT_FLOAT_EQ(fader.multiplierAt(timing::secondsToTicks(3.5)), 1.0f);
}

TEST_F(FaderTest, NoFadePointsIsPassThrough) {
    Passage passage;
    passage.timing.endTicks = timing::secondsToTicks(2.0);
    Fader fader = Fader::forPassage(passage, std::nullopt, kRate);
    EXPECT_TRUE(fader.isPassThrough());

    auto buffer = createTestBuffer(100, 0.7f);
    int64_t position = 0;
    ASSERT_EQ(fader.apply(buffer.data(), buffer.size(), position), ErrorCode::OK);
    for (float sample : buffer) {
        EXPECT_FLOAT_EQ(sample, 0.7f);
    }
    EXPECT_EQ(position, frameTicks(100));
}

// ============================================================================
// Multiplier
// ============================================================================

TEST_F(FaderTest, MultiplierFollowsRegions) {
    Fader fader = Fader::forPassage(createPassage(), std::nullopt, kRate);
    EXPECT_FLOAT_EQ(fader.multiplierAt(0), 0.0f);
    EXPECT_NEAR(fader.multiplierAt(timing::secondsToTicks(0.5)), 0.5f, 1e-6f);
    EXPECT_FLOAT_EQ(fader.multiplierAt(timing::secondsToTicks(1.0)), 1.0f);
    EXPECT_FLOAT_EQ(fader.multiplierAt(timing::secondsToTicks(2.0)), 1.0f);
    EXPECT_FLOAT_EQ(fader.multiplierAt(timing::secondsToTicks(3.0)), 1.0f);
    EXPECT_NEAR(fader.multiplierAt(timing::secondsToTicks(3.25)), 0.75f, 1e-6f);
    EXPECT_FLOAT_EQ(fader.multiplierAt(timing::secondsToTicks(4.0)), 0.0f);
}

TEST_F(FaderTest, OverlappingRegionsMultiply) {
    FadeRegions regions;
    regions.fadeInStartTicks = 0;
    regions.fadeInEndTicks = timing::secondsToTicks(2.0);
    regions.fadeInCurve = FadeCurve::Linear;
    regions.hasFadeOut = true;
    regions.fadeOutStartTicks = timing::secondsToTicks(1.0);
    regions.fadeOutEndTicks = timing::secondsToTicks(5.0);
    regions.fadeOutCurve = FadeCurve::Linear;
    Fader fader(regions, kRate);

    // fade-in at 0.75, fade-out at 1 - 0.5 / 4
    EXPECT_NEAR(fader.multiplierAt(timing::secondsToTicks(1.5)), 0.75f * 0.875f, 1e-6f);
    EXPECT_NEAR(fader.multiplierAt(timing::secondsToTicks(0.5)), 0.25f, 1e-6f);
}

// ============================================================================
// apply()
// ============================================================================

TEST_F(FaderTest, ApplyAcrossChunksMatchesSinglePass) {
    Fader fader = Fader::forPassage(createPassage(), std::nullopt, kRate);

    const size_t totalFrames = 32000;  // 4 s
    auto whole = createTestBuffer(totalFrames);
    int64_t wholePosition = 0;
    ASSERT_EQ(fader.apply(whole.data(), whole.size(), wholePosition), ErrorCode::OK);

    auto chunked = createTestBuffer(totalFrames);
    int64_t chunkPosition = 0;
    const size_t chunkFrames = 777;  // does not divide the passage
    for (size_t offset = 0; offset < totalFrames; offset += chunkFrames) {
        const size_t frames = std::min(chunkFrames, totalFrames - offset);
        ASSERT_EQ(fader.apply(chunked.data() + offset * 2, frames * 2, chunkPosition),
                  ErrorCode::OK);
    }

    EXPECT_EQ(wholePosition, chunkPosition);
    EXPECT_EQ(wholePosition, frameTicks(totalFrames));
    for (size_t i = 0; i < whole.size(); ++i) {
        ASSERT_FLOAT_EQ(whole[i], chunked[i]) << "sample " << i;
    }
}

TEST_F(FaderTest, ApplyUsesFrameStartTick) {
    Fader fader = Fader::forPassage(createPassage(), std::nullopt, kRate);
    auto buffer = createTestBuffer(4);
    int64_t position = 0;
    ASSERT_EQ(fader.apply(buffer.data(), buffer.size(), position), ErrorCode::OK);

    for (size_t frame = 0; frame < 4; ++frame) {
        const float expected = static_cast<float>(frame) / 8000.0f;
        EXPECT_NEAR(buffer[frame * 2], expected, 1e-6f);
        EXPECT_NEAR(buffer[frame * 2 + 1], expected, 1e-6f);
    }
}

TEST_F(FaderTest, ApplyRejectsOddSampleCount) {
    Fader fader = Fader::forPassage(createPassage(), std::nullopt, kRate);
    auto buffer = createTestBuffer(4);
    int64_t position = 1234;
    EXPECT_EQ(fader.apply(buffer.data(), 7, position), ErrorCode::BUFFER_ODD_SAMPLE_COUNT);
    EXPECT_EQ(position, 1234);
    EXPECT_FLOAT_EQ(buffer[0], 1.0f);
}

TEST_F(FaderTest, MiddleSectionIsUntouched) {
    Fader fader = Fader::forPassage(createPassage(), std::nullopt, kRate);
    auto buffer = createTestBuffer(8000, 0.3f);
    int64_t position = timing::secondsToTicks(1.5);
    ASSERT_EQ(fader.apply(buffer.data(), buffer.size(), position), ErrorCode::OK);
    for (float sample : buffer) {
        EXPECT_FLOAT_EQ(sample, 0.3f);
    }
    EXPECT_EQ(position, timing::secondsToTicks(2.5));
}
