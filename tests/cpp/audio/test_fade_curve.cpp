/**
 * @file test_fade_curve.cpp
 * @brief Unit tests for fade curve shapes and parsing.
 */

#include "audio/fade_curve.h"

#include <cmath>
#include <gtest/gtest.h>

using namespace playout;

namespace {

const FadeCurve kAllCurves[] = {FadeCurve::Linear, FadeCurve::Exponential,
                                FadeCurve::Logarithmic, FadeCurve::Cosine,
                                FadeCurve::EqualPower};

}  // namespace

// ============================================================================
// Endpoints
// ============================================================================

TEST(FadeCurve, FadeInEndpointsAreExact) {
    for (FadeCurve curve : kAllCurves) {
        EXPECT_EQ(fadeInGain(curve, 0.0f), 0.0f) << fadeCurveToString(curve);
        EXPECT_EQ(fadeInGain(curve, 1.0f), 1.0f) << fadeCurveToString(curve);
    }
}

TEST(FadeCurve, FadeOutEndpointsAreExact) {
    for (FadeCurve curve : kAllCurves) {
        EXPECT_EQ(fadeOutGain(curve, 0.0f), 1.0f) << fadeCurveToString(curve);
        EXPECT_EQ(fadeOutGain(curve, 1.0f), 0.0f) << fadeCurveToString(curve);
    }
}

TEST(FadeCurve, OutOfRangePositionsClamp) {
    EXPECT_EQ(fadeInGain(FadeCurve::Linear, -0.5f), 0.0f);
    EXPECT_EQ(fadeInGain(FadeCurve::Linear, 1.5f), 1.0f);
    EXPECT_EQ(fadeOutGain(FadeCurve::Cosine, -1.0f), 1.0f);
    EXPECT_EQ(fadeOutGain(FadeCurve::Cosine, 2.0f), 0.0f);
    EXPECT_EQ(fadeShape(FadeCurve::EqualPower, 3.0f), 1.0f);
}

// ============================================================================
// Shapes
// ============================================================================

TEST(FadeCurve, ShapeValuesAtMidpoint) {
    EXPECT_NEAR(fadeInGain(FadeCurve::Linear, 0.5f), 0.5f, 1e-6f);
    EXPECT_NEAR(fadeInGain(FadeCurve::Exponential, 0.5f), 0.25f, 1e-6f);
    EXPECT_NEAR(fadeInGain(FadeCurve::Logarithmic, 0.25f), 0.5f, 1e-6f);
    EXPECT_NEAR(fadeInGain(FadeCurve::Cosine, 0.5f), 0.5f, 1e-6f);
    EXPECT_NEAR(fadeInGain(FadeCurve::EqualPower, 0.5f), std::sqrt(0.5f), 1e-6f);
}

TEST(FadeCurve, FadeOutMirrorsFadeIn) {
    for (FadeCurve curve : kAllCurves) {
        for (float x = 0.05f; x < 1.0f; x += 0.1f) {
            EXPECT_NEAR(fadeOutGain(curve, x), fadeInGain(curve, 1.0f - x), 1e-6f)
                << fadeCurveToString(curve) << " x=" << x;
        }
    }
}

TEST(FadeCurve, FadeInIsMonotonic) {
    for (FadeCurve curve : kAllCurves) {
        float previous = 0.0f;
        for (int i = 1; i <= 100; ++i) {
            const float gain = fadeInGain(curve, static_cast<float>(i) / 100.0f);
            EXPECT_GE(gain, previous) << fadeCurveToString(curve) << " step " << i;
            previous = gain;
        }
    }
}

TEST(FadeCurve, EqualPowerPairKeepsConstantPower) {
    for (float x = 0.0f; x <= 1.0f; x += 0.125f) {
        const float in = fadeInGain(FadeCurve::EqualPower, x);
        const float out = fadeOutGain(FadeCurve::EqualPower, x);
        EXPECT_NEAR(in * in + out * out, 1.0f, 1e-5f) << "x=" << x;
    }
}

// ============================================================================
// Parsing
// ============================================================================

TEST(FadeCurve, ParseNamesCaseInsensitive) {
    EXPECT_EQ(parseFadeCurve("linear"), FadeCurve::Linear);
    EXPECT_EQ(parseFadeCurve("Exponential"), FadeCurve::Exponential);
    EXPECT_EQ(parseFadeCurve("LOGARITHMIC"), FadeCurve::Logarithmic);
    EXPECT_EQ(parseFadeCurve("s-curve"), FadeCurve::Cosine);
    EXPECT_EQ(parseFadeCurve("scurve"), FadeCurve::Cosine);
    EXPECT_EQ(parseFadeCurve("equal_power"), FadeCurve::EqualPower);
    EXPECT_FALSE(parseFadeCurve("parabolic").has_value());
    EXPECT_FALSE(parseFadeCurve("").has_value());
}

TEST(FadeCurve, ToStringParsesBack) {
    for (FadeCurve curve : kAllCurves) {
        EXPECT_EQ(parseFadeCurve(fadeCurveToString(curve)), curve);
    }
}

TEST(FadeCurve, RecommendedPairs) {
    EXPECT_EQ(recommendedPair(FadeCurve::Exponential), FadeCurve::Logarithmic);
    EXPECT_EQ(recommendedPair(FadeCurve::Logarithmic), FadeCurve::Exponential);
    EXPECT_EQ(recommendedPair(FadeCurve::Cosine), FadeCurve::Cosine);
    EXPECT_EQ(recommendedPair(FadeCurve::Linear), FadeCurve::Linear);
}
