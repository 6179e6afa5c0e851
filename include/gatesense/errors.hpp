#pragma once
// Domain errors surfaced to operator tooling

#include <stdexcept>
#include <string>

namespace gatesense {

// The record changed under the caller (gate already merged, suggestion already reviewed)
class StaleStateError : public std::runtime_error {
public:
    explicit StaleStateError(const std::string& what) : std::runtime_error(what) {}
};

// Threshold write rejected; the stored configuration is unchanged
class ConfigValidationError : public std::runtime_error {
public:
    explicit ConfigValidationError(const std::string& what) : std::runtime_error(what) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace gatesense
