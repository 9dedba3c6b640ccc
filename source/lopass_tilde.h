#pragma once
// lopass_tilde.h
// Max/MSP external: "lopass~" — selectable streaming low-pass filter
// MIT License.
//
// Build: Max 8 SDK (msp), C++17, x64
// Object name: lopass~
// Inlets:  1 (signal)
// Outlets: 1 (signal)
// Attributes:
//   @mode (onepole | twotap | window), @decay(0..1), @cutoff(Hz, sets @decay),
//   @window(1..4096 samples)
// Messages:
//   reset — clears filter history
// Notes:
//  - Attribute setters publish into a SettingsMailbox; the perform routine
//    owns the filter stage and picks up new settings at block boundaries.
//    Setters may run on the main thread or, with overdrive on, the scheduler
//    thread; the mailbox accepts publishes from both.
//  - @decay and @cutoff describe the same one-pole filter. The one set last
//    is kept exactly when the sample rate changes; the other is recomputed.

extern "C" {
#include "ext.h"
#include "ext_obex.h"
#include "z_dsp.h"
}

#ifndef C74_EXPORT
#define C74_EXPORT
#endif

#include <atomic>

#include "dsp/cutoff.h"
#include "dsp/params.h"
#include "dsp/stage.h"
#include "dsp/mailbox.h"

struct t_lopass;

void *lopass_new(t_symbol *s, long argc, t_atom *argv);
void lopass_free(t_lopass *x);
void lopass_assist(t_lopass *x, void *b, long m, long a, char *s);
void lopass_reset(t_lopass *x);
void lopass_dsp64(t_lopass *x, t_object *dsp64, short *count, double samplerate, long maxvectorsize, long flags);
void lopass_perform64(t_lopass *x, t_object *dsp64, double **ins, long nin, double **outs, long nout, long sampleframes, long flags, void *userparam);
void C74_EXPORT ext_main(void *r);

// ------------------------------- Audio-thread state
// Owned by the perform routine; the main thread only touches mailbox and
// resetPending.
struct t_lopass_engine {
    explicit t_lopass_engine(const lopass::dsp::StageSettings &settings)
        : stage(settings), mailbox(settings) {}

    lopass::dsp::LowpassStage stage;
    lopass::dsp::SettingsMailbox mailbox;
    std::atomic<bool> resetPending{false};
};

// ------------------------------- Main object
// Allocated by object_alloc, so members are set up in lopass_new.
struct t_lopass {
    t_pxobject ob;

    // Attributes. decay and cutoff mirror tuning for the attribute getters.
    lopass::dsp::OnePoleTuning tuning;
    double decay;
    double cutoff;
    long   window;
    lopass::dsp::FilterMode mode;
    t_symbol *modeSym;

    t_lopass_engine *engine;

    lopass::dsp::StageSettings current_settings() const;
    void publish_settings();
    void sync_tuning();
};
