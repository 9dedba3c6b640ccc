#include "cutoff.h"

#include <cmath>

#include "params.h"

namespace lopass::dsp {

double decay_for_cutoff(double sr, double cutoffHz) {
    if (!(sr > 0.0))
        return 1.0;
    cutoffHz = clampd(cutoffHz, kMinCutoffHz, sr * kMaxCutoffRatio);
    const double x = std::exp(-2.0 * M_PI * cutoffHz / sr);
    return 1.0 - x;
}

double cutoff_for_decay(double sr, double decay) {
    if (!(sr > 0.0))
        return 0.0;
    const double hi = sr * kMaxCutoffRatio;
    if (decay <= 0.0)
        return kMinCutoffHz;
    if (decay >= 1.0)
        return hi;
    return clampd(-std::log(1.0 - decay) * sr / (2.0 * M_PI), kMinCutoffHz, hi);
}

OnePoleTuning::OnePoleTuning(double sr, double decay)
    : sr_(sr), decay_(clampd(decay, 0.0, 1.0)), cutoff_(cutoff_for_decay(sr, decay_)) {}

void OnePoleTuning::set_decay(double decay) {
    decay_ = clampd(decay, 0.0, 1.0);
    cutoff_ = cutoff_for_decay(sr_, decay_);
    followsCutoff_ = false;
}

void OnePoleTuning::set_cutoff(double cutoffHz) {
    if (sr_ > 0.0)
        cutoffHz = clampd(cutoffHz, kMinCutoffHz, sr_ * kMaxCutoffRatio);
    cutoff_ = cutoffHz;
    decay_ = decay_for_cutoff(sr_, cutoff_);
    followsCutoff_ = true;
}

void OnePoleTuning::set_sample_rate(double sr) {
    if (!(sr > 0.0) || sr == sr_)
        return;
    sr_ = sr;
    if (followsCutoff_) {
        cutoff_ = clampd(cutoff_, kMinCutoffHz, sr_ * kMaxCutoffRatio);
        decay_ = decay_for_cutoff(sr_, cutoff_);
    } else {
        cutoff_ = cutoff_for_decay(sr_, decay_);
    }
}

} // namespace lopass::dsp
