#pragma once

#include <stdexcept>
#include <string>

namespace coloc::core {

/// @brief Base exception for all controller programming errors.
///
/// Exceptions are reserved for conditions that indicate a bug or an invalid
/// setup (unmatched timer operations, out-of-range cores, unknown jobs).
/// Expected runtime conditions such as a missing service process are
/// reported as @ref Status / @ref Result values instead.
///
/// @see InvalidStateError, OutOfRangeError
/// @ingroup core
class ControllerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, stopping a job timer that was never started, or recording
/// the start of a job that is not pending.
///
/// @see ControllerError
/// @ingroup core
class InvalidStateError : public ControllerError {
public:
    using ControllerError::ControllerError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example, a core index that is not below the machine's core count,
/// or a job identifier that the catalog did not issue.
///
/// @see ControllerError
/// @ingroup core
class OutOfRangeError : public ControllerError {
public:
    using ControllerError::ControllerError;
};

} // namespace coloc::core
