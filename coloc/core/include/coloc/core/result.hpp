#pragma once

#include <coloc/core/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace coloc::core {

/// @brief Classification of an expected failure reported by a collaborator.
///
/// The control loop handles every kind explicitly; none of them unwinds past
/// a tick.
///
/// @ingroup core
enum class ErrorKind : uint8_t {
    NotFound,   ///< Target process, container or job does not exist.
    Transient,  ///< Temporary failure; the same call may succeed next tick.
    Permanent   ///< The call was rejected and will not succeed as issued.
};

/// @brief Human-readable name of an ErrorKind.
/// @param kind Kind to name.
/// @return Static lowercase name (`"not_found"`, `"transient"`, `"permanent"`).
[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:  return "not_found";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Permanent: return "permanent";
    }
    return "unknown";
}

/// @brief An expected failure: its kind plus a diagnostic message.
/// @ingroup core
struct Error {
    ErrorKind kind;       ///< Failure classification.
    std::string message;  ///< Diagnostic text for the event log.
};

/// @brief Outcome of an operation that returns no value.
///
/// A default-constructed Status is a success.
///
/// @see Result
/// @ingroup core
class Status {
public:
    Status() = default;

    /// @brief Construct a failed status.
    /// @param error The failure.
    Status(Error error) : error_(std::move(error)) {}  // NOLINT(google-explicit-constructor)

    /// @brief Build a failed status in place.
    static Status failure(ErrorKind kind, std::string message) {
        return Status{Error{kind, std::move(message)}};
    }

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /// @brief Access the failure.
    /// @throws InvalidStateError if the status is a success.
    [[nodiscard]] const Error& error() const {
        if (!error_) {
            throw InvalidStateError("Status::error() called on a successful status");
        }
        return *error_;
    }

private:
    std::optional<Error> error_;
};

/// @brief Outcome of an operation that yields a value of type @p T on success.
///
/// @tparam T Success value type.
/// @see Status
/// @ingroup core
template<typename T>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}     // NOLINT(google-explicit-constructor)
    Result(Error error) : storage_(std::move(error)) {} // NOLINT(google-explicit-constructor)

    static Result failure(ErrorKind kind, std::string message) {
        return Result{Error{kind, std::move(message)}};
    }

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(storage_); }
    explicit operator bool() const noexcept { return ok(); }

    /// @brief Access the success value.
    /// @throws InvalidStateError if the result holds an error.
    [[nodiscard]] const T& value() const {
        if (!ok()) {
            throw InvalidStateError("Result::value() called on a failed result: " +
                                    std::get<Error>(storage_).message);
        }
        return std::get<T>(storage_);
    }

    /// @brief Access the failure.
    /// @throws InvalidStateError if the result holds a value.
    [[nodiscard]] const Error& error() const {
        if (ok()) {
            throw InvalidStateError("Result::error() called on a successful result");
        }
        return std::get<Error>(storage_);
    }

    /// @brief Convert to a Status, dropping the value.
    [[nodiscard]] Status status() const {
        return ok() ? Status{} : Status{std::get<Error>(storage_)};
    }

private:
    std::variant<T, Error> storage_;
};

} // namespace coloc::core
