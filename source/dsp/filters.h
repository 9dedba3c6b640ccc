#pragma once

#include <cstddef>
#include <vector>

#include "buffers.h"

namespace lopass::dsp {

// One-pole IIR low-pass: y = decay * x + (1 - decay) * y[n-1].
// decay near 1 follows the input closely, near 0 smooths heavily. Values
// outside [0, 1] are taken as given and may produce a divergent output.
class SinglePoleLowpass {
public:
    explicit SinglePoleLowpass(double decay);

    double process(double x);
    void reset() { z_ = 0.0; }

    double decay() const noexcept { return b_; }
    double input_coefficient() const noexcept { return b_; }
    double feedback_coefficient() const noexcept { return a_; }

private:
    double a_ = 0.0; // feedback
    double b_ = 0.0; // input
    double z_ = 0.0;
};

// Two-tap moving average of the current and previous input.
class SimpleFIRLowpass {
public:
    SimpleFIRLowpass() = default;

    double process(double x);
    void reset() { z_ = 0.0; }

private:
    double z_ = 0.0;
};

// Uniform N-tap FIR average over the last `window` inputs. Throws
// InvalidConfiguration for a zero window.
class SlidingWindowFIRLowpass {
public:
    explicit SlidingWindowFIRLowpass(std::size_t window);

    double process(double x);
    void reset() { history_.clear(); }

    std::size_t window() const noexcept { return history_.size(); }
    const std::vector<double> &coefficients() const noexcept { return coeffs_; }

private:
    std::vector<double> coeffs_{};
    SampleRing history_{};
};

} // namespace lopass::dsp
