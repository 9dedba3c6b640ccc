#include "filters.h"

#include "errors.h"

namespace lopass::dsp {

SinglePoleLowpass::SinglePoleLowpass(double decay)
    : a_(1.0 - decay), b_(decay) {}

double SinglePoleLowpass::process(double x) {
    z_ = b_ * x + a_ * z_;
    return z_;
}

double SimpleFIRLowpass::process(double x) {
    const double y = 0.5 * (x + z_);
    z_ = x;
    return y;
}

SlidingWindowFIRLowpass::SlidingWindowFIRLowpass(std::size_t window) {
    if (window == 0)
        throw InvalidConfiguration("sliding window size must be at least 1");
    coeffs_.assign(window, 1.0 / static_cast<double>(window));
    history_.setup(window);
}

double SlidingWindowFIRLowpass::process(double x) {
    history_.push(x);
    double y = 0.0;
    const std::size_t n = coeffs_.size();
    for (std::size_t i = 0; i < n; ++i)
        y += coeffs_[i] * history_.recent(i);
    return y;
}

} // namespace lopass::dsp
