#pragma once

#include "dsp_assert.h"

namespace lopass::dsp {

// Runs filter.process() over one host block. in and out may alias.
template <typename Filter>
void process_block(Filter &filter, const double *in, double *out, long frames) {
    if (frames <= 0)
        return;
    dsp_assert_msg(in != nullptr && out != nullptr, "host passed a null block pointer");
    for (long n = 0; n < frames; ++n)
        out[n] = filter.process(in[n]);
}

} // namespace lopass::dsp
