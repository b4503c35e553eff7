#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace strata::runtime {

/// Fatal, configuration-time failures. Per-row and per-value problems are
/// recovered inside the engine and never surface here.
enum class ErrorKind : std::uint8_t {
    InputNotFound,
    EmptyInput,
    ReadFailure,
    UnknownGroupColumn,
    WriteFailure,
};

[[nodiscard]] constexpr auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::InputNotFound:
            return "input not found";
        case ErrorKind::EmptyInput:
            return "empty input";
        case ErrorKind::ReadFailure:
            return "read failure";
        case ErrorKind::UnknownGroupColumn:
            return "unknown group column";
        case ErrorKind::WriteFailure:
            return "write failure";
    }
    return "error";
}

struct AnalysisError {
    ErrorKind kind = ErrorKind::ReadFailure;
    std::string message;

    [[nodiscard]] auto format() const -> std::string {
        return std::string(to_string(kind)) + ": " + message;
    }
};

}  // namespace strata::runtime
