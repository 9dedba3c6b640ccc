#include "stage.h"

#include <cstring>
#include <exception>

#include "block.h"

namespace lopass::dsp {

FilterMode mode_from_string(const char *name, FilterMode fallback) noexcept {
    if (!name)
        return fallback;
    if (std::strcmp(name, "onepole") == 0)
        return FilterMode::OnePole;
    if (std::strcmp(name, "twotap") == 0)
        return FilterMode::TwoTap;
    if (std::strcmp(name, "window") == 0)
        return FilterMode::Window;
    return fallback;
}

const char *to_string(FilterMode mode) noexcept {
    switch (mode) {
    case FilterMode::OnePole:
        return "onepole";
    case FilterMode::TwoTap:
        return "twotap";
    case FilterMode::Window:
        return "window";
    default:
        return "onepole";
    }
}

LowpassStage::LowpassStage()
    : LowpassStage(StageSettings{}) {}

LowpassStage::LowpassStage(const StageSettings &settings)
    : settings_(settings),
      onePole_(settings.decay),
      window_(settings.window) {}

void LowpassStage::configure(const StageSettings &settings) {
    // Build the fallible part first so a bad window leaves *this untouched.
    if (settings.window != settings_.window)
        window_ = SlidingWindowFIRLowpass(settings.window);
    if (settings.decay != settings_.decay)
        onePole_ = SinglePoleLowpass(settings.decay);
    settings_ = settings;
}

bool LowpassStage::try_configure(const StageSettings &settings) noexcept {
    try {
        configure(settings);
    } catch (const std::exception &) {
        return false;
    }
    return true;
}

double LowpassStage::process(double x) {
    switch (settings_.mode) {
    case FilterMode::TwoTap:
        return twoTap_.process(x);
    case FilterMode::Window:
        return window_.process(x);
    case FilterMode::OnePole:
    default:
        return onePole_.process(x);
    }
}

void LowpassStage::process_block(const double *in, double *out, long frames) {
    switch (settings_.mode) {
    case FilterMode::TwoTap:
        dsp::process_block(twoTap_, in, out, frames);
        break;
    case FilterMode::Window:
        dsp::process_block(window_, in, out, frames);
        break;
    case FilterMode::OnePole:
    default:
        dsp::process_block(onePole_, in, out, frames);
        break;
    }
}

void LowpassStage::reset() {
    onePole_.reset();
    twoTap_.reset();
    window_.reset();
}

} // namespace lopass::dsp
