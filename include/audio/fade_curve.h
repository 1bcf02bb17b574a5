#ifndef FADE_CURVE_H
#define FADE_CURVE_H

#include <optional>
#include <string>

namespace playout {

// Fade curve shape. Each shape is a pure function of the normalized position
// x in [0, 1] inside the fade region; fade-out evaluates the same shape at
// (1 - x) so both directions start and end on exact 0.0 / 1.0.
enum class FadeCurve {
    Linear,       // y = x
    Exponential,  // y = x^2, slow start (fade-in default)
    Logarithmic,  // y = sqrt(x), fast start (fade-out default)
    Cosine,       // y = (1 - cos(pi x)) / 2, S-curve
    EqualPower    // y = sin(pi x / 2), constant power across an overlap
};

// Shape value for x clamped to [0, 1].
float fadeShape(FadeCurve curve, float x);

// Gain while fading in: 0.0 at x = 0, 1.0 at x = 1.
float fadeInGain(FadeCurve curve, float x);

// Gain while fading out: 1.0 at x = 0, 0.0 at x = 1.
float fadeOutGain(FadeCurve curve, float x);

// Accepts "linear", "exponential", "logarithmic", "cosine" / "scurve" /
// "s-curve", "equal_power" (case-insensitive).
std::optional<FadeCurve> parseFadeCurve(const std::string& str);

const char* fadeCurveToString(FadeCurve curve);

// Natural partner for a crossfade (Exponential <-> Logarithmic, others
// pair with themselves).
FadeCurve recommendedPair(FadeCurve curve);

}  // namespace playout

#endif  // FADE_CURVE_H
