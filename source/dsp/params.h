#pragma once

#include <cstddef>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace lopass::dsp {

constexpr std::size_t kMaxWindow = 4096;
constexpr double kMinCutoffHz = 1.0;
constexpr double kMaxCutoffRatio = 0.45; // of the sample rate

enum class FilterMode { OnePole = 0, TwoTap, Window };

struct AttributeDefaults {
    static constexpr FilterMode mode = FilterMode::OnePole;
    static constexpr double decay = 0.5;
    static constexpr long window = 8;
    static constexpr double cutoff = 1000.0; // Hz
};

inline double clampd(double v, double lo, double hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

inline long clampl(long v, long lo, long hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

} // namespace lopass::dsp
