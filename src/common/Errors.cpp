#include "common/Errors.h"

namespace quantcore {

namespace {
std::string joinViolations(const std::vector<std::string>& violations) {
    std::string out = "Invalid parameters: ";
    for (size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) out += "; ";
        out += violations[i];
    }
    return out;
}
}

InsufficientDataError::InsufficientDataError(const std::string& indicator, size_t required, size_t actual)
    : std::runtime_error("Insufficient data for " + indicator + ": need " +
                         std::to_string(required) + " bars, got " + std::to_string(actual))
    , indicator_(indicator)
    , required_(required)
    , actual_(actual)
{}

InvalidParameterError::InvalidParameterError(std::vector<std::string> violations)
    : std::runtime_error(joinViolations(violations))
    , violations_(std::move(violations))
{}

InvalidParameterError::InvalidParameterError(const std::string& violation)
    : InvalidParameterError(std::vector<std::string>{violation})
{}

} // namespace quantcore
