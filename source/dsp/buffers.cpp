#include "buffers.h"

#include <algorithm>

#include "dsp_assert.h"

namespace lopass::dsp {

void SampleRing::setup(std::size_t len) {
    buffer_.assign(len, 0.0);
    newest_ = 0;
}

// Evicts the oldest sample, stores value as the newest and returns the
// evicted sample.
double SampleRing::push(double value) {
    const std::size_t len = buffer_.size();
    if (len == 0)
        return value;
    // The oldest entry sits one slot ahead of the newest.
    const std::size_t slot = (newest_ + 1) % len;
    const double evicted = buffer_[slot];
    buffer_[slot] = value;
    newest_ = slot;
    return evicted;
}

// age 0 is the most recent sample, size() - 1 the oldest.
double SampleRing::recent(std::size_t age) const {
    const std::size_t len = buffer_.size();
    dsp_assert_index(age, len);
    if (age >= len)
        return 0.0;
    return buffer_[(newest_ + len - age) % len];
}

void SampleRing::clear() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0);
    newest_ = 0;
}

} // namespace lopass::dsp
