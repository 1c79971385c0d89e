#pragma once

/// @file game_error.hpp
/// @brief Error value carried by GameResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "lhe/foundation/error_code.hpp"

namespace lhe::foundation {

/// What went wrong, why, and optionally which objects were involved.
///
/// The context slot carries a typed payload back to the caller, e.g. the
/// ReactionConflict of a rejected rule:
/// @code
///   if (auto* conflict = err.context<health::ReactionConflict>()) { ... }
/// @endcode
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message, std::any context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// "Subsystem/CodeName: message", or without ": message" when empty.
    [[nodiscard]] std::string describe() const {
        std::string text(subsystem());
        text += '/';
        text += errorCodeName(code_);
        if (!message_.empty()) {
            text += ": ";
            text += message_;
        }
        return text;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace lhe::foundation
