#pragma once

/// @file include/cmimap/errors.hpp
/// @brief Exception hierarchy for the orchestration layer.
///
/// Numeric kernels never throw; they return `std::optional`. Anything that
/// must abort a run (bad preconditions, a malformed bundle, a failed worker,
/// unreadable config or archive) throws one of these and is reported by
/// `main` as `[FATAL] <what>`.

#include <stdexcept>
#include <string>

namespace cmimap {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Input violates a documented precondition (grid order, lag range, length).
class PreconditionError : public Error {
public:
    using Error::Error;
};

/// A measurement bundle or record set breaks the shape/type contract.
class ValidationError : public Error {
public:
    using Error::Error;
};

/// The surrogate worker pool could not deliver the requested results.
class CoordinationError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

class IoError : public Error {
public:
    using Error::Error;
};

} // namespace cmimap
