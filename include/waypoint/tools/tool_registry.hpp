#pragma once

#include "waypoint/core/result.hpp"
#include "tool_spec.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace waypoint::tools {

using namespace waypoint::core;

// Tool registration entry
struct RegisteredTool {
    ToolSpec spec;
    ToolHandler handler;
};

// Name -> handler table for the external calls tasks can make
class ToolRegistry {
public:
    ToolRegistry() = default;

    // Register a tool
    Result<void, Error> register_tool(const ToolSpec& spec, ToolHandler handler);

    // Unregister a tool
    Result<void, Error> unregister_tool(const ToolId& id);

    // Check if tool exists
    bool has_tool(const ToolId& id) const;

    // Get tool spec
    std::optional<ToolSpec> get_spec(const ToolId& id) const;

    // Get all tool specs, sorted by name
    std::vector<ToolSpec> get_all_specs() const;

    // Schemas of every tool, for agents choosing what to plan
    Json catalog() const;

    // Run a tool by name. Never throws: unknown tools, bad arguments,
    // handler exceptions and "error" payloads all come back as errors.
    Result<Json, Error> execute(const ToolId& id, const Json& args) const;

    // Get tool count
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ToolId, RegisteredTool> tools_;

    // Validate tool arguments against spec
    Result<void, Error> validate_args(const ToolSpec& spec, const Json& args) const;
};

}  // namespace waypoint::tools
