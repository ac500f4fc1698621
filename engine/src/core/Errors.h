#pragma once
#include <stdexcept>
#include <string>

namespace landgem {

// Hard-invalid model parameter (k, L0, methane content, NMOC concentration)
class ParameterError : public std::invalid_argument {
public:
    explicit ParameterError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Malformed call input: mismatched sequences, efficiency outside [0,1],
// unknown stream name
class InputShapeError : public std::invalid_argument {
public:
    explicit InputShapeError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Requested key (year, preset name) not present
class LookupError : public std::out_of_range {
public:
    explicit LookupError(const std::string& msg) : std::out_of_range(msg) {}
};

} // namespace landgem
