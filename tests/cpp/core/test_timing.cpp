/**
 * @file test_timing.cpp
 * @brief Unit tests for the tick time domain.
 */

#include "core/timing.h"

#include <gtest/gtest.h>

using namespace playout;

TEST(Timing, TickRateIsCommonMultipleOfSupportedRates) {
    const uint32_t rates[] = {8000,  11025, 16000, 22050,  32000, 44100,
                              48000, 88200, 96000, 176400, 192000};
    for (uint32_t rate : rates) {
        EXPECT_TRUE(timing::isSupportedSampleRate(rate)) << rate;
        EXPECT_EQ(timing::ticksPerSample(rate) * static_cast<int64_t>(rate), timing::TICK_RATE)
            << rate;
    }
}

TEST(Timing, KnownTicksPerSample) {
    EXPECT_EQ(timing::ticksPerSample(44100), 640);
    EXPECT_EQ(timing::ticksPerSample(48000), 588);
    EXPECT_EQ(timing::ticksPerSample(192000), 147);
    EXPECT_EQ(timing::ticksPerSample(0), 0);
}

TEST(Timing, UnsupportedRates) {
    EXPECT_FALSE(timing::isSupportedSampleRate(0));
    EXPECT_FALSE(timing::isSupportedSampleRate(7000));
    EXPECT_FALSE(timing::isSupportedSampleRate(44000));  // does not divide the tick rate
    EXPECT_FALSE(timing::isSupportedSampleRate(384000));
}

TEST(Timing, MillisecondConversion) {
    EXPECT_EQ(timing::msToTicks(1), 28224);
    EXPECT_EQ(timing::msToTicks(1000), timing::TICK_RATE);
    EXPECT_EQ(timing::ticksToMs(timing::msToTicks(2500)), 2500);
    EXPECT_EQ(timing::ticksToMs(28223), 0);
}

TEST(Timing, SecondsConversion) {
    EXPECT_DOUBLE_EQ(timing::ticksToSeconds(timing::TICK_RATE * 3), 3.0);
    EXPECT_EQ(timing::secondsToTicks(0.5), timing::TICK_RATE / 2);
}

TEST(Timing, SampleConversionIsExact) {
    EXPECT_EQ(timing::samplesToTicks(44100, 44100), timing::TICK_RATE);
    EXPECT_EQ(timing::ticksToSamples(timing::TICK_RATE, 44100), 44100u);
    EXPECT_EQ(timing::ticksToSamples(timing::samplesToTicks(12345, 48000), 48000), 12345u);
}

TEST(Timing, TicksToSamplesFloorsAndRejectsNegative) {
    EXPECT_EQ(timing::ticksToSamples(639, 44100), 0u);
    EXPECT_EQ(timing::ticksToSamples(640, 44100), 1u);
    EXPECT_EQ(timing::ticksToSamples(-640, 44100), 0u);
    EXPECT_EQ(timing::ticksToSamples(640, 0), 0u);
}

TEST(Timing, TicksToSamplesCeilRoundsUpPartialFrames) {
    EXPECT_EQ(timing::ticksToSamplesCeil(0, 44100), 0u);
    EXPECT_EQ(timing::ticksToSamplesCeil(1, 44100), 1u);
    EXPECT_EQ(timing::ticksToSamplesCeil(640, 44100), 1u);
    EXPECT_EQ(timing::ticksToSamplesCeil(641, 44100), 2u);
    EXPECT_EQ(timing::ticksToSamplesCeil(-640, 44100), 0u);
    EXPECT_EQ(timing::ticksToSamplesCeil(640, 0), 0u);
}

TEST(Timing, LongPositionsDoNotOverflow) {
    // Ten hours at 192 kHz
    const int64_t ticks = timing::TICK_RATE * 36000;
    EXPECT_EQ(timing::ticksToSamples(ticks, 192000), static_cast<size_t>(192000) * 36000);
}
