#pragma once

/// @file error_code.hpp
/// @brief Error codes for the layered health engine.

#include <cstdint>
#include <string_view>

namespace lhe::foundation {

/// Error codes. The high byte names the subsystem that raised the error:
/// 0x00 general argument checks, 0x06 configuration and rule loading,
/// 0x08 logging, 0x09 health classifications.
enum class ErrorCode : uint32_t {
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    OutOfRange = 0x0006,

    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigurationError = 0x0603,

    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,

    ClassificationNotFound = 0x0900,
};

constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) >> 8) {
        case 0x00: return "General";
        case 0x06: return "Config";
        case 0x08: return "Logger";
        case 0x09: return "Health";
        default: return "Unknown";
    }
}

/// Enumerator name of @p code, "Unknown" for values outside the enum.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::LoggerNotInitialized: return "LoggerNotInitialized";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
        case ErrorCode::ClassificationNotFound: return "ClassificationNotFound";
    }
    return "Unknown";
}

} // namespace lhe::foundation
