#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace waypoint::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    Timeout = 6,
    InternalError = 9,
    InvalidState = 10,

    // State errors (100-199)
    DiffValidationFailed = 100,
    InvalidStatusTransition = 101,
    ConcurrencyTimeout = 102,
    SessionNotFound = 103,
    TemplateInvalid = 104,

    // Persistence errors (200-299)
    PersistenceFailed = 200,
    StoreReadFailed = 201,
    StateCorrupted = 202,

    // Tool errors (300-399)
    ToolNotFound = 300,
    ToolExecutionFailed = 301,
    ToolValidationFailed = 302,
    ToolTimeout = 303,
    BatchTimeout = 304,
    NetworkError = 305,

    // Agent errors (400-499)
    AgentFailed = 400,
    AgentUnavailable = 401,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::DiffValidationFailed: return "Proposed diff is malformed";
        case ErrorCode::InvalidStatusTransition: return "Task status may not move backward";
        case ErrorCode::ConcurrencyTimeout: return "Could not acquire session lock";
        case ErrorCode::SessionNotFound: return "Session not found";
        case ErrorCode::TemplateInvalid: return "State template is invalid";

        case ErrorCode::PersistenceFailed: return "Failed to persist session state";
        case ErrorCode::StoreReadFailed: return "Failed to read from session store";
        case ErrorCode::StateCorrupted: return "Stored session state is corrupted";

        case ErrorCode::ToolNotFound: return "Tool not found";
        case ErrorCode::ToolExecutionFailed: return "Tool execution failed";
        case ErrorCode::ToolValidationFailed: return "Tool parameter validation failed";
        case ErrorCode::ToolTimeout: return "Tool execution timed out";
        case ErrorCode::BatchTimeout: return "Batch timed out before the task finished";
        case ErrorCode::NetworkError: return "Network error";

        case ErrorCode::AgentFailed: return "Agent failed to produce a proposal";
        case ErrorCode::AgentUnavailable: return "Agent unavailable";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Check if error is retriable
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConcurrencyTimeout:
        case ErrorCode::ToolExecutionFailed:
        case ErrorCode::ToolTimeout:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

// Check if error is fatal (no recovery possible)
inline bool is_fatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigParseFailed:
        case ErrorCode::ConfigValidationFailed:
        case ErrorCode::StateCorrupted:
        case ErrorCode::TemplateInvalid:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (session id, tool name, etc.)
    std::optional<std::string> source;   // Source location or component

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    // Predicates
    bool is_retriable() const { return waypoint::core::is_retriable(code); }
    bool is_fatal() const { return waypoint::core::is_fatal(code); }
    bool is_ok() const { return code == ErrorCode::Ok; }

    // Get full error message
    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace waypoint::core
