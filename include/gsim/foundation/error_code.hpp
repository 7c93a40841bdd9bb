#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the simulation core.

#include <cstdint>
#include <string_view>

namespace gsim::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem owns a 256-value range (0x100), so the producing
/// component can be read off the value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Event bus (0x0100 - 0x01FF)
    InvalidEventFormat = 0x0100,
    HandlerDisabled = 0x0101,
    EventQueueFull = 0x0102,

    // Behavior engine (0x0200 - 0x02FF)
    UnknownTree = 0x0200,
    InvalidTree = 0x0201,

    // Decision dispatch (0x0300 - 0x03FF)
    DecisionFailed = 0x0300,
    DecisionTimeout = 0x0301,
    DispatcherStopped = 0x0302,

    // State manager (0x0400 - 0x04FF)
    InvalidState = 0x0400,
    TransactionFailed = 0x0401,
    CorruptedSnapshot = 0x0402,
    InvalidSnapshot = 0x0403,

    // Persistence (0x0500 - 0x05FF)
    PersistenceError = 0x0500,
    SnapshotWriteFailed = 0x0501,
    SnapshotReadFailed = 0x0502,
    SnapshotNotFound = 0x0503,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,
    JobTimeout = 0x0704,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Event";
        case 0x0200: return "Behavior";
        case 0x0300: return "Decision";
        case 0x0400: return "State";
        case 0x0500: return "Persistence";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Short symbolic name, used in log lines and event payloads.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::NotImplemented: return "NotImplemented";
        case ErrorCode::InvalidEventFormat: return "InvalidEventFormat";
        case ErrorCode::HandlerDisabled: return "HandlerDisabled";
        case ErrorCode::EventQueueFull: return "EventQueueFull";
        case ErrorCode::UnknownTree: return "UnknownTree";
        case ErrorCode::InvalidTree: return "InvalidTree";
        case ErrorCode::DecisionFailed: return "DecisionFailed";
        case ErrorCode::DecisionTimeout: return "DecisionTimeout";
        case ErrorCode::DispatcherStopped: return "DispatcherStopped";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::TransactionFailed: return "TransactionFailed";
        case ErrorCode::CorruptedSnapshot: return "CorruptedSnapshot";
        case ErrorCode::InvalidSnapshot: return "InvalidSnapshot";
        case ErrorCode::PersistenceError: return "PersistenceError";
        case ErrorCode::SnapshotWriteFailed: return "SnapshotWriteFailed";
        case ErrorCode::SnapshotReadFailed: return "SnapshotReadFailed";
        case ErrorCode::SnapshotNotFound: return "SnapshotNotFound";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigInvalidValue: return "ConfigInvalidValue";
        case ErrorCode::ThreadError: return "ThreadError";
        case ErrorCode::JobScheduleFailed: return "JobScheduleFailed";
        case ErrorCode::JobNotFound: return "JobNotFound";
        case ErrorCode::JobCancelled: return "JobCancelled";
        case ErrorCode::JobTimeout: return "JobTimeout";
        case ErrorCode::LoggerError: return "LoggerError";
        case ErrorCode::LoggerNotInitialized: return "LoggerNotInitialized";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace gsim::foundation
