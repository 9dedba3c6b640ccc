#pragma once

#include <stdexcept>
#include <string>

namespace lopass::dsp {

// Raised when a filter is constructed with parameters that cannot describe a
// valid filter. No instance is produced.
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string &what)
        : std::invalid_argument(what) {}
};

} // namespace lopass::dsp
