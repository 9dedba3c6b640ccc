#include "dsp/block.h"
#include "dsp/cutoff.h"
#include "dsp/errors.h"
#include "dsp/filters.h"
#include "dsp/mailbox.h"
#include "dsp/stage.h"

#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

using lopass::dsp::FilterMode;
using lopass::dsp::LowpassStage;
using lopass::dsp::SettingsMailbox;
using lopass::dsp::StageSettings;

namespace stage_tests {
namespace {

std::vector<double> make_noise(std::size_t count) {
    std::vector<double> out(count, 0.0);
    std::uint32_t rng = 0x1234567u;
    for (double &v : out) {
        rng ^= rng << 13;
        rng ^= rng >> 17;
        rng ^= rng << 5;
        v = static_cast<double>(rng & 0xFFFF) / 32768.0 - 1.0;
    }
    return out;
}

} // namespace

bool run_cutoff_mapping() {
    const double sr = 48000.0;

    const double decay = lopass::dsp::decay_for_cutoff(sr, 1000.0);
    const double expected = 1.0 - std::exp(-2.0 * M_PI * 1000.0 / sr);
    if (std::abs(decay - expected) > 1.0e-12) {
        std::cerr << "decay_for_cutoff(1 kHz) = " << decay << ", expected " << expected << std::endl;
        return false;
    }
    const double back = lopass::dsp::cutoff_for_decay(sr, decay);
    if (std::abs(back - 1000.0) > 1.0e-6) {
        std::cerr << "cutoff_for_decay did not invert: " << back << " Hz" << std::endl;
        return false;
    }

    // Higher cutoff means less smoothing.
    if (!(lopass::dsp::decay_for_cutoff(sr, 5000.0) > decay)) {
        std::cerr << "decay did not grow with cutoff" << std::endl;
        return false;
    }

    // Clamped to [1 Hz, 0.45 * sr].
    const double low = lopass::dsp::decay_for_cutoff(sr, 0.0);
    const double lowRef = lopass::dsp::decay_for_cutoff(sr, lopass::dsp::kMinCutoffHz);
    const double high = lopass::dsp::decay_for_cutoff(sr, 1.0e9);
    const double highRef = lopass::dsp::decay_for_cutoff(sr, sr * lopass::dsp::kMaxCutoffRatio);
    if (low != lowRef || high != highRef) {
        std::cerr << "Cutoff was not clamped: low=" << low << " high=" << high << std::endl;
        return false;
    }

    if (lopass::dsp::decay_for_cutoff(0.0, 1000.0) != 1.0) {
        std::cerr << "Zero sample rate should map to pass-through" << std::endl;
        return false;
    }

    // The reported cutoff stays inside the range decay_for_cutoff accepts.
    const double hiHz = sr * lopass::dsp::kMaxCutoffRatio;
    if (lopass::dsp::cutoff_for_decay(sr, 0.0) != lopass::dsp::kMinCutoffHz) {
        std::cerr << "decay=0 should report the lowest cutoff" << std::endl;
        return false;
    }
    for (double d : {0.95, 0.99, 1.0}) {
        const double hz = lopass::dsp::cutoff_for_decay(sr, d);
        if (hz != hiHz) {
            std::cerr << "decay=" << d << " reported " << hz << " Hz, above the " << hiHz << " Hz limit" << std::endl;
            return false;
        }
    }

    // Inside the invertible range decay survives a trip through the cutoff.
    for (double d : {0.01, 0.5, 0.9}) {
        const double again = lopass::dsp::decay_for_cutoff(sr, lopass::dsp::cutoff_for_decay(sr, d));
        if (std::abs(again - d) > 1.0e-12) {
            std::cerr << "decay=" << d << " came back as " << again << std::endl;
            return false;
        }
    }
    return true;
}

bool run_tuning_follows_last_set() {
    // A decay set directly is kept exactly across sample-rate changes,
    // including the pass-through and mute ends.
    for (double d : {0.0, 0.95, 0.99, 1.0}) {
        lopass::dsp::OnePoleTuning tuning(48000.0, 0.5);
        tuning.set_decay(d);
        tuning.set_sample_rate(44100.0);
        tuning.set_sample_rate(96000.0);
        if (tuning.decay() != d || tuning.follows_cutoff()) {
            std::cerr << "decay=" << d << " drifted to " << tuning.decay() << " after a sample-rate change"
                      << std::endl;
            return false;
        }
        const double hz = tuning.cutoff();
        if (hz < lopass::dsp::kMinCutoffHz || hz > 96000.0 * lopass::dsp::kMaxCutoffRatio) {
            std::cerr << "decay=" << d << " reported cutoff " << hz << " Hz out of range" << std::endl;
            return false;
        }
    }

    // A cutoff set directly keeps its frequency; the decay follows the rate.
    lopass::dsp::OnePoleTuning tuning(48000.0, 0.5);
    tuning.set_cutoff(1000.0);
    tuning.set_sample_rate(96000.0);
    if (tuning.cutoff() != 1000.0 || tuning.decay() != lopass::dsp::decay_for_cutoff(96000.0, 1000.0)) {
        std::cerr << "1 kHz cutoff not kept at 96 kHz: cutoff=" << tuning.cutoff() << " decay=" << tuning.decay()
                  << std::endl;
        return false;
    }
    tuning.set_cutoff(20000.0);
    tuning.set_sample_rate(22050.0);
    if (tuning.cutoff() != 22050.0 * lopass::dsp::kMaxCutoffRatio) {
        std::cerr << "Cutoff above the new limit was not clamped: " << tuning.cutoff() << std::endl;
        return false;
    }

    // Setting decay again hands authority back to it.
    tuning.set_decay(0.25);
    tuning.set_sample_rate(48000.0);
    if (tuning.decay() != 0.25) {
        std::cerr << "Decay set after a cutoff was recomputed: " << tuning.decay() << std::endl;
        return false;
    }

    // Ignored: non-positive rates.
    tuning.set_sample_rate(0.0);
    if (tuning.sample_rate() != 48000.0) {
        std::cerr << "Zero sample rate was accepted" << std::endl;
        return false;
    }
    return true;
}

bool run_block_matches_per_sample() {
    const std::vector<double> input = make_noise(257);

    lopass::dsp::SlidingWindowFIRLowpass perSample(7);
    lopass::dsp::SlidingWindowFIRLowpass blocked(7);

    std::vector<double> ref(input.size(), 0.0);
    for (std::size_t n = 0; n < input.size(); ++n)
        ref[n] = perSample.process(input[n]);

    // Uneven block sizes, processed in place.
    std::vector<double> buf = input;
    const std::array<long, 4> sizes{64, 1, 100, 92};
    long offset = 0;
    for (long frames : sizes) {
        lopass::dsp::process_block(blocked, buf.data() + offset, buf.data() + offset, frames);
        offset += frames;
    }
    lopass::dsp::process_block(blocked, buf.data(), buf.data(), 0);

    for (std::size_t n = 0; n < input.size(); ++n) {
        if (buf[n] != ref[n]) {
            std::cerr << "Block output diverged at n=" << n << ": " << buf[n] << " vs " << ref[n] << std::endl;
            return false;
        }
    }
    return true;
}

bool run_stage_mode_switch() {
    if (lopass::dsp::mode_from_string("twotap") != FilterMode::TwoTap ||
        lopass::dsp::mode_from_string("window") != FilterMode::Window ||
        lopass::dsp::mode_from_string("onepole") != FilterMode::OnePole ||
        lopass::dsp::mode_from_string("bogus", FilterMode::Window) != FilterMode::Window ||
        lopass::dsp::mode_from_string(nullptr) != FilterMode::OnePole) {
        std::cerr << "mode_from_string mismatch" << std::endl;
        return false;
    }
    if (std::strcmp(lopass::dsp::to_string(FilterMode::Window), "window") != 0) {
        std::cerr << "to_string(Window) mismatch" << std::endl;
        return false;
    }

    StageSettings settings;
    settings.mode = FilterMode::TwoTap;
    LowpassStage stage(settings);
    if (stage.process(1.0) != 0.5 || stage.process(1.0) != 1.0) {
        std::cerr << "Two-tap stage output mismatch" << std::endl;
        return false;
    }

    settings.mode = FilterMode::Window;
    settings.window = 4;
    stage.configure(settings);
    std::array<double, 4> in{4.0, 0.0, 0.0, 0.0};
    std::array<double, 4> out{};
    stage.process_block(in.data(), out.data(), static_cast<long>(in.size()));
    for (double y : out) {
        if (y != 1.0) {
            std::cerr << "Window stage output " << y << ", expected 1" << std::endl;
            return false;
        }
    }

    settings.mode = FilterMode::OnePole;
    settings.decay = 1.0;
    stage.configure(settings);
    if (stage.process(-0.6) != -0.6) {
        std::cerr << "One-pole stage with decay=1 should pass through" << std::endl;
        return false;
    }

    // Switching back to a mode resumes its own history.
    settings.mode = FilterMode::TwoTap;
    stage.configure(settings);
    if (stage.process(0.0) != 0.5) {
        std::cerr << "Two-tap stage lost its history across a mode switch" << std::endl;
        return false;
    }

    stage.reset();
    if (stage.process(1.0) != 0.5) {
        std::cerr << "Stage reset did not clear history" << std::endl;
        return false;
    }
    return true;
}

bool run_stage_rejects_zero_window() {
    StageSettings settings;
    settings.mode = FilterMode::Window;
    settings.window = 2;
    LowpassStage stage(settings);

    StageSettings bad = settings;
    bad.window = 0;
    bad.decay = 0.1;
    try {
        stage.configure(bad);
        std::cerr << "configure() accepted window=0" << std::endl;
        return false;
    } catch (const lopass::dsp::InvalidConfiguration &) {
    }

    if (stage.settings().window != 2 || stage.settings().decay != settings.decay) {
        std::cerr << "Failed configure() modified the stage settings" << std::endl;
        return false;
    }
    if (stage.process(2.0) != 1.0) {
        std::cerr << "Stage unusable after a rejected configure()" << std::endl;
        return false;
    }

    try {
        LowpassStage broken(bad);
        std::cerr << "LowpassStage built with window=0" << std::endl;
        return false;
    } catch (const lopass::dsp::InvalidConfiguration &) {
    }
    return true;
}

bool run_stage_try_configure() {
    StageSettings settings;
    settings.mode = FilterMode::Window;
    settings.window = 2;
    LowpassStage stage(settings);

    StageSettings zero = settings;
    zero.window = 0;
    if (stage.try_configure(zero)) {
        std::cerr << "try_configure() accepted window=0" << std::endl;
        return false;
    }

    // Too large to allocate: reported, not thrown.
    StageSettings huge = settings;
    huge.window = std::numeric_limits<std::size_t>::max();
    if (stage.try_configure(huge)) {
        std::cerr << "try_configure() accepted an unallocatable window" << std::endl;
        return false;
    }
    if (stage.settings().window != 2 || stage.process(2.0) != 1.0) {
        std::cerr << "Stage changed after rejected try_configure()" << std::endl;
        return false;
    }

    StageSettings good = settings;
    good.window = 4;
    if (!stage.try_configure(good) || stage.settings().window != 4) {
        std::cerr << "try_configure() rejected window=4" << std::endl;
        return false;
    }
    return true;
}

bool run_mailbox_handoff() {
    StageSettings initial;
    SettingsMailbox box(initial);
    StageSettings got;
    if (box.fetch(got)) {
        std::cerr << "Fresh mailbox reported pending settings" << std::endl;
        return false;
    }

    StageSettings first;
    first.mode = FilterMode::Window;
    first.window = 16;
    box.publish(first);

    StageSettings second = first;
    second.decay = 0.125;
    second.window = 32;
    box.publish(second);

    // Only the latest publication is delivered, once.
    if (!box.fetch(got)) {
        std::cerr << "Published settings were not fetched" << std::endl;
        return false;
    }
    if (got.mode != FilterMode::Window || got.window != 32 || got.decay != 0.125) {
        std::cerr << "Fetched stale settings: window=" << got.window << " decay=" << got.decay << std::endl;
        return false;
    }
    if (box.fetch(got)) {
        std::cerr << "Same publication fetched twice" << std::endl;
        return false;
    }
    return true;
}

bool run_mailbox_threaded_handoff() {
    SettingsMailbox box;
    LowpassStage stage;
    std::atomic<bool> done{false};

    std::thread control([&] {
        for (std::size_t n = 1; n <= 2000; ++n) {
            StageSettings s;
            s.mode = FilterMode::Window;
            s.window = n % 64 + 1;
            s.decay = static_cast<double>(s.window) / 128.0;
            box.publish(s);
        }
        StageSettings last;
        last.mode = FilterMode::Window;
        last.window = 5;
        last.decay = 5.0 / 128.0;
        box.publish(last);
        done.store(true, std::memory_order_release);
    });

    std::array<double, 32> block{};
    bool consistent = true;
    auto drain = [&] {
        StageSettings s;
        if (!box.fetch(s))
            return;
        // Every delivered snapshot must come from a single publication.
        if (s.decay != static_cast<double>(s.window) / 128.0)
            consistent = false;
        stage.configure(s);
        stage.process_block(block.data(), block.data(), static_cast<long>(block.size()));
    };
    while (!done.load(std::memory_order_acquire))
        drain();
    control.join();
    drain();

    if (!consistent) {
        std::cerr << "Mailbox delivered a torn settings snapshot" << std::endl;
        return false;
    }
    if (stage.settings().window != 5 || stage.settings().mode != FilterMode::Window) {
        std::cerr << "Final publication was not applied: window=" << stage.settings().window << std::endl;
        return false;
    }
    return true;
}

bool run_mailbox_two_publishers() {
    SettingsMailbox box;
    std::atomic<int> running{2};

    auto producer = [&](std::size_t base) {
        for (std::size_t n = 0; n < 5000; ++n) {
            StageSettings s;
            s.mode = (n & 1U) ? FilterMode::Window : FilterMode::TwoTap;
            s.window = base + n % 32;
            s.decay = static_cast<double>(s.window) / 256.0;
            box.publish(s);
        }
        running.fetch_sub(1, std::memory_order_release);
    };
    std::thread a(producer, 1);
    std::thread b(producer, 100);

    bool consistent = true;
    std::size_t fetched = 0;
    auto drain = [&] {
        StageSettings s;
        if (!box.fetch(s))
            return;
        ++fetched;
        if (s.decay != static_cast<double>(s.window) / 256.0)
            consistent = false;
    };
    while (running.load(std::memory_order_acquire) > 0)
        drain();
    a.join();
    b.join();

    StageSettings last;
    last.window = 7;
    last.decay = 7.0 / 256.0;
    box.publish(last);
    StageSettings got;
    if (!box.fetch(got) || got.window != 7) {
        std::cerr << "Publication after concurrent producers was lost" << std::endl;
        return false;
    }
    if (!consistent) {
        std::cerr << "Concurrent publishers produced a torn snapshot (" << fetched << " fetched)" << std::endl;
        return false;
    }
    return true;
}

} // namespace stage_tests
