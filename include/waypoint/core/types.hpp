#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace waypoint::core {

namespace fs = std::filesystem;

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;
using Duration = std::chrono::milliseconds;

// Common type aliases
using SessionId = std::string;
using TaskId = std::string;
using ToolId = std::string;

// Which sub-agent produced something
enum class AgentRole {
    Root,
    Planner,
    Follower,
    Finalizer,
    Orchestrator
};

inline std::string_view agent_role_to_string(AgentRole role) {
    switch (role) {
        case AgentRole::Root: return "root_agent";
        case AgentRole::Planner: return "travel_planner";
        case AgentRole::Follower: return "follower";
        case AgentRole::Finalizer: return "finalizer";
        case AgentRole::Orchestrator: return "orchestrator";
    }
    return "unknown";
}

// ISO-8601 UTC timestamp, second precision
inline std::string format_timestamp(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

inline std::string now_timestamp() {
    return format_timestamp(Clock::now());
}

inline int64_t to_millis(Duration d) {
    return static_cast<int64_t>(d.count());
}

}  // namespace waypoint::core
