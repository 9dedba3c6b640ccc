#pragma once

namespace lopass::dsp {

// Maps a -3 dB cutoff to the decay factor of SinglePoleLowpass. The cutoff is
// clamped to [kMinCutoffHz, kMaxCutoffRatio * sr]; a non-positive sample rate
// returns 1.0 (pass-through).
double decay_for_cutoff(double sr, double cutoffHz);

// Cutoff of a given decay, clamped to the same range decay_for_cutoff accepts.
// decay_for_cutoff(sr, cutoff_for_decay(sr, d)) == d only for d inside
// [decay_for_cutoff(sr, kMinCutoffHz), decay_for_cutoff(sr, kMaxCutoffRatio * sr)].
double cutoff_for_decay(double sr, double decay);

// Decay and cutoff of one SinglePoleLowpass as a host exposes them. Whichever
// of the two was set last is authoritative: a sample-rate change keeps a set
// cutoff audible by recomputing the decay, and keeps a set decay exactly by
// recomputing only the reported cutoff.
class OnePoleTuning {
public:
    OnePoleTuning(double sr, double decay);

    void set_decay(double decay);
    void set_cutoff(double cutoffHz);
    void set_sample_rate(double sr);

    double decay() const noexcept { return decay_; }
    double cutoff() const noexcept { return cutoff_; }
    double sample_rate() const noexcept { return sr_; }
    bool follows_cutoff() const noexcept { return followsCutoff_; }

private:
    double sr_;
    double decay_;
    double cutoff_;
    bool followsCutoff_ = false;
};

} // namespace lopass::dsp
