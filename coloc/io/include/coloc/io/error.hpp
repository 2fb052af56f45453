#pragma once

/// @file error.hpp
/// @brief Exception type of the coloc I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>
#include <utility>

namespace coloc::io {

/// @brief Malformed, incomplete or inconsistent configuration or event log.
/// @ingroup io
///
/// what() reads `"<context>: <message>"` when a context is given. The
/// context names the file, the JSON field (`jobs[2]`, `runner`) or the
/// record the problem was found in.
///
/// @see load_config, load_event_log
class LoaderError : public std::runtime_error {
public:
    explicit LoaderError(const std::string& message)
        : std::runtime_error(message) {}

    LoaderError(const std::string& message, std::string context)
        : std::runtime_error(context + ": " + message)
        , context_(std::move(context)) {}

    /// @brief Where the error was found; empty if unknown.
    [[nodiscard]] const std::string& context() const noexcept { return context_; }

private:
    std::string context_;
};

} // namespace coloc::io
