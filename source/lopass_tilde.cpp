#include "lopass_tilde.h"

#include <algorithm>
#include <cstdio>
#include <cstddef>
#include <cstring>
#include <new>

using lopass::dsp::clampl;
using lopass::dsp::FilterMode;

static constexpr std::size_t kAssistStringMax = 256;

static t_class* s_lopass_class = nullptr;

namespace {

double atom_to_double(long argc, t_atom* argv, double fallback) {
    if (argc <= 0 || argv == nullptr)
        return fallback;
    if (atom_gettype(argv) == A_LONG)
        return static_cast<double>(atom_getlong(argv));
    if (atom_gettype(argv) == A_FLOAT)
        return atom_getfloat(argv);
    return fallback;
}

long atom_to_long(long argc, t_atom* argv, long fallback) {
    if (argc <= 0 || argv == nullptr)
        return fallback;
    if (atom_gettype(argv) == A_LONG)
        return static_cast<long>(atom_getlong(argv));
    if (atom_gettype(argv) == A_FLOAT)
        return static_cast<long>(atom_getfloat(argv));
    return fallback;
}

} // namespace

// ------------------------------------------------------------ Settings

lopass::dsp::StageSettings t_lopass::current_settings() const {
    lopass::dsp::StageSettings s;
    s.mode = mode;
    s.decay = decay;
    s.window = static_cast<std::size_t>(std::max(window, 1L));
    return s;
}

void t_lopass::sync_tuning() {
    decay = tuning.decay();
    cutoff = tuning.cutoff();
}

void t_lopass::publish_settings() {
    if (engine)
        engine->mailbox.publish(current_settings());
}

// ------------------------------------------------------------ Attributes

t_max_err lopass_attr_set_decay(t_lopass* x, void*, long argc, t_atom* argv) {
    if (!x)
        return MAX_ERR_GENERIC;
    x->tuning.set_decay(atom_to_double(argc, argv, x->tuning.decay()));
    x->sync_tuning();
    x->publish_settings();
    return MAX_ERR_NONE;
}

t_max_err lopass_attr_set_cutoff(t_lopass* x, void*, long argc, t_atom* argv) {
    if (!x)
        return MAX_ERR_GENERIC;
    x->tuning.set_cutoff(atom_to_double(argc, argv, x->tuning.cutoff()));
    x->sync_tuning();
    x->publish_settings();
    return MAX_ERR_NONE;
}

t_max_err lopass_attr_set_window(t_lopass* x, void*, long argc, t_atom* argv) {
    if (!x)
        return MAX_ERR_GENERIC;
    const long requested = atom_to_long(argc, argv, x->window);
    if (requested < 1) {
        object_error((t_object*)x, "window must be at least 1 sample (got %ld)", requested);
        return MAX_ERR_GENERIC;
    }
    x->window = clampl(requested, 1, static_cast<long>(lopass::dsp::kMaxWindow));
    x->publish_settings();
    return MAX_ERR_NONE;
}

t_max_err lopass_attr_set_mode(t_lopass* x, void*, long argc, t_atom* argv) {
    if (!x)
        return MAX_ERR_GENERIC;
    t_symbol* sym = (argc > 0 && argv) ? atom_getsym(argv) : x->modeSym;
    if (!sym)
        sym = gensym(lopass::dsp::to_string(x->mode));
    const FilterMode parsed = lopass::dsp::mode_from_string(sym->s_name, x->mode);
    if (std::strcmp(lopass::dsp::to_string(parsed), sym->s_name) != 0)
        object_warn((t_object*)x, "unknown mode '%s', keeping %s", sym->s_name, lopass::dsp::to_string(parsed));
    x->mode = parsed;
    x->modeSym = gensym(lopass::dsp::to_string(x->mode));
    x->publish_settings();
    return MAX_ERR_NONE;
}

t_max_err lopass_attr_get_mode(t_lopass* x, void*, long* argc, t_atom** argv) {
    if (!x || !argc || !argv)
        return MAX_ERR_GENERIC;
    if (!*argv)
        *argv = (t_atom*)sysmem_newptr(sizeof(t_atom));
    if (!*argv) {
        *argc = 0;
        return MAX_ERR_GENERIC;
    }
    *argc = 1;
    t_symbol* sym = x->modeSym ? x->modeSym : gensym(lopass::dsp::to_string(x->mode));
    atom_setsym(*argv, sym);
    return MAX_ERR_NONE;
}

// ------------------------------------------------------------ Object lifecycle

void *lopass_new(t_symbol *, long argc, t_atom *argv) {
    t_lopass *x = (t_lopass *)object_alloc(s_lopass_class);
    if (!x)
        return nullptr;

    dsp_setup((t_pxobject *)x, 1);
    outlet_new((t_object *)x, "signal");

    const double sr = sys_getsr() > 0.0 ? sys_getsr() : 48000.0;
    new (&x->tuning) lopass::dsp::OnePoleTuning(sr, lopass::dsp::AttributeDefaults::decay);
    x->sync_tuning();
    x->mode = lopass::dsp::AttributeDefaults::mode;
    x->modeSym = gensym(lopass::dsp::to_string(x->mode));
    x->window = lopass::dsp::AttributeDefaults::window;
    x->engine = nullptr;

    // Optional first argument: decay factor.
    if (argc > 0 && (atom_gettype(argv) == A_LONG || atom_gettype(argv) == A_FLOAT))
        lopass_attr_set_decay(x, nullptr, 1, argv);

    attr_args_process(x, argc, argv);

    x->engine = new (std::nothrow) t_lopass_engine(x->current_settings());
    if (!x->engine) {
        object_error((t_object *)x, "out of memory");
        dsp_free((t_pxobject *)x);
        return nullptr;
    }

    return x;
}

void lopass_free(t_lopass *x) {
    dsp_free((t_pxobject *)x);
    delete x->engine;
    x->engine = nullptr;
}

void lopass_assist(t_lopass *x, void *b, long m, long a, char *s) {
    (void)x;
    (void)b;
    (void)a;
    if (m == ASSIST_INLET)
        std::snprintf(s, kAssistStringMax, "Signal in (with attributes)");
    else
        std::snprintf(s, kAssistStringMax, "Low-passed signal out");
}

void lopass_reset(t_lopass *x) {
    if (x && x->engine)
        x->engine->resetPending.store(true, std::memory_order_release);
}

void lopass_report_config_error(t_lopass *x, t_symbol *, long, t_atom *) {
    object_error((t_object *)x, "rejected filter settings, previous filter kept");
}

void lopass_dsp64(t_lopass *x, t_object *dsp64, short *count, double samplerate, long maxvectorsize, long) {
    (void)maxvectorsize;
    if (samplerate > 0.0 && samplerate != x->tuning.sample_rate()) {
        x->tuning.set_sample_rate(samplerate);
        x->sync_tuning();
        x->publish_settings();
    }
    object_method(dsp64, gensym("dsp_add64"), x, (t_perfroutine64)lopass_perform64, 0, nullptr);
    (void)count;
}

void lopass_perform64(t_lopass *x, t_object *, double **ins, long nin, double **outs, long nout, long sampleframes, long, void *) {
    if (nout < 1 || !outs[0])
        return;
    if (!x || !x->engine || x->ob.z_disabled || nin < 1 || !ins[0]) {
        std::fill(outs[0], outs[0] + sampleframes, 0.0);
        return;
    }

    t_lopass_engine &engine = *x->engine;

    lopass::dsp::StageSettings pending;
    if (engine.mailbox.fetch(pending) && !engine.stage.try_configure(pending))
        defer_low(x, (method)lopass_report_config_error, nullptr, 0, nullptr);
    if (engine.resetPending.exchange(false, std::memory_order_acq_rel))
        engine.stage.reset();

    engine.stage.process_block(ins[0], outs[0], sampleframes);
}

extern "C" C74_EXPORT void ext_main(void *r) {
    (void)r;
    t_class *c = class_new("lopass~", (method)lopass_new, (method)lopass_free, sizeof(t_lopass), 0L, A_GIMME, 0);

    class_addmethod(c, (method)lopass_dsp64, "dsp64", A_CANT, 0);
    class_addmethod(c, (method)lopass_assist, "assist", A_CANT, 0);
    class_addmethod(c, (method)lopass_reset, "reset", 0);

    CLASS_ATTR_SYM(c, "mode", 0, t_lopass, modeSym);
    CLASS_ATTR_ACCESSORS(c, "mode", lopass_attr_get_mode, lopass_attr_set_mode);
    CLASS_ATTR_ENUM(c, "mode", 0, "onepole twotap window");
    CLASS_ATTR_LABEL(c, "mode", 0, "Filter Mode");

    CLASS_ATTR_DOUBLE(c, "decay", 0, t_lopass, decay);
    CLASS_ATTR_ACCESSORS(c, "decay", NULL, lopass_attr_set_decay);
    CLASS_ATTR_FILTER_CLIP(c, "decay", 0.0, 1.0);
    CLASS_ATTR_LABEL(c, "decay", 0, "One-Pole Decay");

    CLASS_ATTR_DOUBLE(c, "cutoff", 0, t_lopass, cutoff);
    CLASS_ATTR_ACCESSORS(c, "cutoff", NULL, lopass_attr_set_cutoff);
    CLASS_ATTR_FILTER_MIN(c, "cutoff", lopass::dsp::kMinCutoffHz);
    CLASS_ATTR_LABEL(c, "cutoff", 0, "One-Pole Cutoff (Hz)");

    CLASS_ATTR_LONG(c, "window", 0, t_lopass, window);
    CLASS_ATTR_ACCESSORS(c, "window", NULL, lopass_attr_set_window);
    CLASS_ATTR_FILTER_CLIP(c, "window", 1, static_cast<long>(lopass::dsp::kMaxWindow));
    CLASS_ATTR_LABEL(c, "window", 0, "FIR Window (samples)");

    class_dspinit(c);
    class_register(CLASS_BOX, c);
    s_lopass_class = c;
}
