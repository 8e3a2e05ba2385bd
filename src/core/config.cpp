#include "waypoint/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace waypoint::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    if (const char* env = std::getenv("WAYPOINT_CONFIG")) {
        return fs::path(expand_path(std::string(env)));
    }
    return fs::path(expand_path(std::string("~/.waypoint/config.yaml")));
}

void Config::expand_paths() {
    state.store_path = expand_path(state.store_path);
    if (!state.template_path.empty()) {
        state.template_path = expand_path(state.template_path);
    }
    if (!observability.log_path.empty()) {
        observability.log_path = expand_path(observability.log_path);
    }
}

Result<void, Error> Config::validate() const {
    if (executor.pool_size <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "executor.pool_size must be positive"
        );
    }

    if (executor.task_timeout_ms <= 0 || executor.batch_timeout_ms <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "executor timeouts must be positive"
        );
    }

    if (executor.batch_timeout_ms < executor.task_timeout_ms) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "executor.batch_timeout_ms must not be shorter than task_timeout_ms"
        );
    }

    if (executor.max_retries < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "executor.max_retries must be at least 1"
        );
    }

    if (state.lock_timeout_ms <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "state.lock_timeout_ms must be positive"
        );
    }

    if (orchestrator.max_iterations < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "orchestrator.max_iterations must be at least 1"
        );
    }

    if (orchestrator.commit_retries < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "orchestrator.commit_retries must not be negative"
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto exec_node = root["executor"]) {
            config.executor.pool_size = exec_node["pool_size"].as<int>(config.executor.pool_size);
            config.executor.task_timeout_ms = exec_node["task_timeout_ms"].as<int>(config.executor.task_timeout_ms);
            config.executor.batch_timeout_ms = exec_node["batch_timeout_ms"].as<int>(config.executor.batch_timeout_ms);
            config.executor.max_retries = exec_node["max_retries"].as<int>(config.executor.max_retries);
            config.executor.retry_backoff_ms = exec_node["retry_backoff_ms"].as<int>(config.executor.retry_backoff_ms);
        }

        if (auto state_node = root["state"]) {
            config.state.store_path = state_node["store_path"].as<std::string>(config.state.store_path.string());
            config.state.template_path = state_node["template_path"].as<std::string>(config.state.template_path.string());
            config.state.lock_timeout_ms = state_node["lock_timeout_ms"].as<int>(config.state.lock_timeout_ms);
            config.state.history_limit = state_node["history_limit"].as<int>(config.state.history_limit);
        }

        if (auto orch_node = root["orchestrator"]) {
            config.orchestrator.max_iterations = orch_node["max_iterations"].as<int>(config.orchestrator.max_iterations);
            config.orchestrator.commit_retries = orch_node["commit_retries"].as<int>(config.orchestrator.commit_retries);
            config.orchestrator.commit_retry_backoff_ms = orch_node["commit_retry_backoff_ms"].as<int>(config.orchestrator.commit_retry_backoff_ms);
            config.orchestrator.history_turns = orch_node["history_turns"].as<int>(config.orchestrator.history_turns);
        }

        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = obs_node["log_path"].as<std::string>(config.observability.log_path.string());
            config.observability.log_max_size_mb = obs_node["log_max_size_mb"].as<int>(config.observability.log_max_size_mb);
            config.observability.log_max_files = obs_node["log_max_files"].as<int>(config.observability.log_max_files);
        }

        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "executor" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "pool_size" << YAML::Value << executor.pool_size;
        out << YAML::Key << "task_timeout_ms" << YAML::Value << executor.task_timeout_ms;
        out << YAML::Key << "batch_timeout_ms" << YAML::Value << executor.batch_timeout_ms;
        out << YAML::Key << "max_retries" << YAML::Value << executor.max_retries;
        out << YAML::Key << "retry_backoff_ms" << YAML::Value << executor.retry_backoff_ms;
        out << YAML::EndMap;

        out << YAML::Key << "state" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "store_path" << YAML::Value << state.store_path.string();
        out << YAML::Key << "template_path" << YAML::Value << state.template_path.string();
        out << YAML::Key << "lock_timeout_ms" << YAML::Value << state.lock_timeout_ms;
        out << YAML::Key << "history_limit" << YAML::Value << state.history_limit;
        out << YAML::EndMap;

        out << YAML::Key << "orchestrator" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_iterations" << YAML::Value << orchestrator.max_iterations;
        out << YAML::Key << "commit_retries" << YAML::Value << orchestrator.commit_retries;
        out << YAML::Key << "commit_retry_backoff_ms" << YAML::Value << orchestrator.commit_retry_backoff_ms;
        out << YAML::Key << "history_turns" << YAML::Value << orchestrator.history_turns;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::Key << "log_max_size_mb" << YAML::Value << observability.log_max_size_mb;
        out << YAML::Key << "log_max_files" << YAML::Value << observability.log_max_files;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace waypoint::core
