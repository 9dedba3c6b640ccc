#pragma once

#include <vector>
#include <cstddef>

namespace lopass::dsp {

// Fixed-capacity history of the most recent samples. Storage is allocated
// once by setup(); push() overwrites the oldest entry in place.
class SampleRing {
public:
    SampleRing() = default;

    void setup(std::size_t len);
    double push(double value);
    double recent(std::size_t age) const;
    void clear();
    std::size_t size() const noexcept { return buffer_.size(); }

private:
    std::vector<double> buffer_{};
    std::size_t newest_ = 0;
};

} // namespace lopass::dsp
