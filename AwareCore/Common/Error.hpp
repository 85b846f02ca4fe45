// Error.hpp - std::expected based error handling for the Aware core
//
// Front-door validation and every HAL request report failure through Result<T>.
// The error carries the NAN status later surfaced to a client callback, plus the
// capture site for the log line.
//
//   Result<void> ValidateMessage(std::span<const uint8_t> msg, size_t maxLen) {
//       if (msg.size() > maxLen) {
//           return AWR_ERROR_INVALID("Message longer than capabilities allow");
//       }
//       return {};
//   }
//
//   auto result = hal.Publish(txid, 0, config);
//   if (!result) {
//       result.error().Log();
//       callback->OnSessionConfigFail(FailureStatus(result));
//   }

#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

#include "StatusCodes.hpp"
#include "../Logging/Logging.hpp"

namespace AWR {

/// Call site captured through compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

enum class ErrorSeverity : uint8_t {
    /// The interface was not up yet; the same request may succeed later
    Recoverable,
    /// The request itself is wrong or was refused
    Fatal,
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
    }
    return "UNKNOWN";
}

struct Error {
    NanStatus status;
    SourceLocation location;
    ErrorSeverity severity;
    const char* message;

    /// Use the AWR_ERROR_* macros instead of calling this directly
    [[nodiscard]] static constexpr Error Make(
        NanStatus status,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{status, loc, sev, msg};
    }

    /// A failed request is reported to its client, so the line is not an error-level log.
    void Log() const noexcept {
        AWR_LOG(Core,
                "[%{public}s] %{public}s:%d in %{public}s() - status=%{public}s (%{public}s)",
                ToString(severity),
                location.FileName().data(),
                location.line,
                location.function,
                ToString(status).data(),
                message);
    }
};

template<typename T>
using Result = std::expected<T, Error>;

#define AWR_ERROR_FATAL(status, msg) \
    std::unexpected(::AWR::Error::Make((status), ::AWR::ErrorSeverity::Fatal, (msg)))

/// Malformed request detected before any HAL interaction
#define AWR_ERROR_INVALID(msg) \
    AWR_ERROR_FATAL(::AWR::NanStatus::kInvalidArgs, (msg))

/// Interface not available yet
#define AWR_ERROR_NOT_READY(msg) \
    std::unexpected(::AWR::Error::Make(::AWR::NanStatus::kNanNotAllowed, \
                                       ::AWR::ErrorSeverity::Recoverable, (msg)))

/// Request that does not fit the session it targets
#define AWR_ERROR_INTERNAL(msg) \
    AWR_ERROR_FATAL(::AWR::NanStatus::kInternalFailure, (msg))

/// Returns the error of a Result<void> from the enclosing function
#define AWR_TRY(expr)                                    \
    do {                                                 \
        if (auto _result = (expr); !_result) {           \
            return std::unexpected(_result.error());     \
        }                                                \
    } while (0)

/// Status to report for a failed result. A rejection without a usable code is
/// reported as INTERNAL_FAILURE.
template<typename T>
[[nodiscard]] NanStatus FailureStatus(const Result<T>& result) noexcept {
    if (result || result.error().status == NanStatus::kSuccess) {
        return NanStatus::kInternalFailure;
    }
    return result.error().status;
}

} // namespace AWR
