#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "stage.h"

namespace lopass::dsp {

// Hands StageSettings from control threads to the thread that owns a
// LowpassStage. Concurrent publishers serialize on the sequence counter among
// themselves; fetch() never waits on them and reports each newer publication
// once.
class SettingsMailbox {
public:
    SettingsMailbox() = default;
    explicit SettingsMailbox(const StageSettings &initial);

    SettingsMailbox(const SettingsMailbox &) = delete;
    SettingsMailbox &operator=(const SettingsMailbox &) = delete;

    // Producer side. Safe from any number of threads.
    void publish(const StageSettings &settings) noexcept;

    // Consumer side, one thread only. Fills out and returns true if settings
    // newer than the last successful fetch are available. A fetch that races
    // a publish returns false; the next call picks the publication up.
    bool fetch(StageSettings &out) noexcept;

private:
    void store(const StageSettings &settings) noexcept;

    std::atomic<std::uint32_t> seq_{0};
    std::atomic<int> mode_{static_cast<int>(AttributeDefaults::mode)};
    std::atomic<double> decay_{AttributeDefaults::decay};
    std::atomic<std::size_t> window_{static_cast<std::size_t>(AttributeDefaults::window)};
    std::uint32_t seen_ = 0;
};

} // namespace lopass::dsp
