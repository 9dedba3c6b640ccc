#pragma once

#include <cstddef>

#include "filters.h"
#include "params.h"

namespace lopass::dsp {

FilterMode mode_from_string(const char *name, FilterMode fallback = FilterMode::OnePole) noexcept;

const char *to_string(FilterMode mode) noexcept;

struct StageSettings {
    FilterMode mode = AttributeDefaults::mode;
    double decay = AttributeDefaults::decay;
    std::size_t window = static_cast<std::size_t>(AttributeDefaults::window);
};

// One selectable low-pass filter, as a host exposes it. Only the filter of the
// active mode is fed; the others keep their state untouched.
class LowpassStage {
public:
    LowpassStage();
    explicit LowpassStage(const StageSettings &settings);

    // Rebuilds the filters whose configuration changed. If it throws
    // (InvalidConfiguration, or an allocation failure) the previous
    // configuration stays active.
    void configure(const StageSettings &settings);

    // configure() for callers that cannot let an exception through, such as
    // an audio callback. Returns false if the settings were rejected or the
    // rebuild could not allocate; the previous configuration stays active.
    bool try_configure(const StageSettings &settings) noexcept;

    double process(double x);
    void process_block(const double *in, double *out, long frames);
    void reset();

    const StageSettings &settings() const noexcept { return settings_; }

private:
    StageSettings settings_{};
    SinglePoleLowpass onePole_;
    SimpleFIRLowpass twoTap_{};
    SlidingWindowFIRLowpass window_;
};

} // namespace lopass::dsp
