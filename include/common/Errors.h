#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace quantcore {

// Caller supplied a history shorter than the indicator needs.
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(const std::string& indicator, size_t required, size_t actual);

    const std::string& indicator() const { return indicator_; }
    size_t required() const { return required_; }
    size_t actual() const { return actual_; }

private:
    std::string indicator_;
    size_t required_;
    size_t actual_;
};

// Construction-time validation failure. Carries every violated constraint.
class InvalidParameterError : public std::runtime_error {
public:
    explicit InvalidParameterError(std::vector<std::string> violations);
    explicit InvalidParameterError(const std::string& violation);

    const std::vector<std::string>& violations() const { return violations_; }

private:
    std::vector<std::string> violations_;
};

// Numeric failure inside an indicator or strategy evaluation.
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace quantcore
