#pragma once

/// @file game_error.hpp
/// @brief Error type carried by GameResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "gsim/foundation/error_code.hpp"

namespace gsim::foundation {

/// Error code, human-readable message and optional typed context.
///
/// The context slot carries the structured detail a caller may need to
/// react to the failure, e.g. the aggregated ValidationResult of a rejected
/// state update or the index of the event that sank a batch publish.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch / no context.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// "<CodeName>: <message>" for log lines.
    [[nodiscard]] std::string describe() const {
        std::string out(errorCodeName(code_));
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace gsim::foundation
