#include "audio/fade_curve.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace playout {

namespace {

constexpr float kPi = 3.14159265358979323846f;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

float fadeShape(FadeCurve curve, float x) {
    const float t = std::clamp(x, 0.0f, 1.0f);

    float y;
    switch (curve) {
    case FadeCurve::Exponential:
        y = t * t;
        break;
    case FadeCurve::Logarithmic:
        y = std::sqrt(t);
        break;
    case FadeCurve::Cosine:
        y = 0.5f * (1.0f - std::cos(kPi * t));
        break;
    case FadeCurve::EqualPower:
        y = std::sin(0.5f * kPi * t);
        break;
    case FadeCurve::Linear:
    default:
        y = t;
        break;
    }

    // cos/sin can land a hair outside [0, 1] at the endpoints.
    return std::clamp(y, 0.0f, 1.0f);
}

float fadeInGain(FadeCurve curve, float x) {
    if (x <= 0.0f) {
        return 0.0f;
    }
    if (x >= 1.0f) {
        return 1.0f;
    }
    return fadeShape(curve, x);
}

float fadeOutGain(FadeCurve curve, float x) {
    if (x <= 0.0f) {
        return 1.0f;
    }
    if (x >= 1.0f) {
        return 0.0f;
    }
    return fadeShape(curve, 1.0f - x);
}

std::optional<FadeCurve> parseFadeCurve(const std::string& str) {
    const std::string lower = toLower(str);
    if (lower == "linear") {
        return FadeCurve::Linear;
    }
    if (lower == "exponential") {
        return FadeCurve::Exponential;
    }
    if (lower == "logarithmic") {
        return FadeCurve::Logarithmic;
    }
    if (lower == "cosine" || lower == "scurve" || lower == "s-curve" || lower == "s_curve") {
        return FadeCurve::Cosine;
    }
    if (lower == "equal_power" || lower == "equalpower") {
        return FadeCurve::EqualPower;
    }
    return std::nullopt;
}

const char* fadeCurveToString(FadeCurve curve) {
    switch (curve) {
    case FadeCurve::Exponential:
        return "exponential";
    case FadeCurve::Logarithmic:
        return "logarithmic";
    case FadeCurve::Cosine:
        return "cosine";
    case FadeCurve::EqualPower:
        return "equal_power";
    case FadeCurve::Linear:
    default:
        return "linear";
    }
}

FadeCurve recommendedPair(FadeCurve curve) {
    switch (curve) {
    case FadeCurve::Exponential:
        return FadeCurve::Logarithmic;
    case FadeCurve::Logarithmic:
        return FadeCurve::Exponential;
    default:
        return curve;
    }
}

}  // namespace playout
