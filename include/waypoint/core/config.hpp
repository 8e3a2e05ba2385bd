#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>

namespace waypoint::core {

// Task executor / worker pool configuration
struct ExecutorConfig {
    int pool_size = 4;               // Fixed worker count shared by all batches
    int task_timeout_ms = 30000;     // Per tool call, measured from dispatch to a worker
    int batch_timeout_ms = 120000;   // Whole Execute stage
    int max_retries = 3;             // Attempts per task on retriable errors
    int retry_backoff_ms = 500;
};

// State manager configuration
struct StateConfig {
    fs::path store_path = "~/.waypoint/sessions";
    fs::path template_path;          // Empty: built-in template
    int lock_timeout_ms = 5000;      // Bound on waiting for a session's commit lock
    int history_limit = 50;          // Chat messages kept per session
};

// Orchestrator loop configuration
struct OrchestratorConfig {
    int max_iterations = 3;          // Execute/Reflect rounds per request
    int commit_retries = 3;          // Retries on ConcurrencyTimeout
    int commit_retry_backoff_ms = 50;
    int history_turns = 5;           // Chat messages handed to the intake agent
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    fs::path log_path;               // Empty: console only
    int log_max_size_mb = 10;
    int log_max_files = 3;
};

// Main configuration
struct Config {
    ExecutorConfig executor;
    StateConfig state;
    OrchestratorConfig orchestrator;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand environment variables in paths
    void expand_paths();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace waypoint::core
