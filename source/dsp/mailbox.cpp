#include "mailbox.h"

#include <thread>

namespace lopass::dsp {

// seq_ is odd while a write is in progress. Each completed publish advances
// it by two, so an even value different from seen_ marks fresh settings.

SettingsMailbox::SettingsMailbox(const StageSettings &initial) {
    store(initial);
}

void SettingsMailbox::store(const StageSettings &settings) noexcept {
    mode_.store(static_cast<int>(settings.mode), std::memory_order_relaxed);
    decay_.store(settings.decay, std::memory_order_relaxed);
    window_.store(settings.window, std::memory_order_relaxed);
}

void SettingsMailbox::publish(const StageSettings &settings) noexcept {
    // Claim the write by moving seq_ from even to odd; another publisher
    // holding it keeps seq_ odd until it is done.
    std::uint32_t s = seq_.load(std::memory_order_relaxed);
    for (;;) {
        if ((s & 1U) != 0U) {
            std::this_thread::yield();
            s = seq_.load(std::memory_order_relaxed);
            continue;
        }
        if (seq_.compare_exchange_weak(s, s + 1, std::memory_order_acquire, std::memory_order_relaxed))
            break;
    }
    std::atomic_thread_fence(std::memory_order_release);
    store(settings);
    seq_.store(s + 2, std::memory_order_release);
}

bool SettingsMailbox::fetch(StageSettings &out) noexcept {
    const std::uint32_t before = seq_.load(std::memory_order_acquire);
    if ((before & 1U) != 0U || before == seen_)
        return false;
    StageSettings snapshot;
    snapshot.mode = static_cast<FilterMode>(mode_.load(std::memory_order_relaxed));
    snapshot.decay = decay_.load(std::memory_order_relaxed);
    snapshot.window = window_.load(std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_acquire);
    if (seq_.load(std::memory_order_relaxed) != before)
        return false;
    seen_ = before;
    out = snapshot;
    return true;
}

} // namespace lopass::dsp
