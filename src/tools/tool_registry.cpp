#include "waypoint/tools/tool_registry.hpp"

#include <algorithm>

namespace waypoint::tools {

Result<void, Error> ToolRegistry::register_tool(const ToolSpec& spec, ToolHandler handler) {
    if (spec.name.empty() || !handler) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Tool needs a name and a handler",
            spec.name
        );
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (tools_.count(spec.name)) {
        return Result<void, Error>::err(
            ErrorCode::AlreadyExists,
            "Tool already registered",
            spec.name
        );
    }

    tools_[spec.name] = RegisteredTool{spec, std::move(handler)};
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::unregister_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!tools_.count(id)) {
        return Result<void, Error>::err(
            ErrorCode::ToolNotFound,
            "Tool not found",
            id
        );
    }

    tools_.erase(id);
    return Result<void, Error>::ok();
}

bool ToolRegistry::has_tool(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(id) > 0;
}

std::optional<ToolSpec> ToolRegistry::get_spec(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return std::nullopt;
    }

    return it->second.spec;
}

std::vector<ToolSpec> ToolRegistry::get_all_specs() const {
    std::vector<ToolSpec> specs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        specs.reserve(tools_.size());
        for (const auto& [id, tool] : tools_) {
            specs.push_back(tool.spec);
        }
    }

    std::sort(specs.begin(), specs.end(),
        [](const ToolSpec& a, const ToolSpec& b) { return a.name < b.name; });
    return specs;
}

Json ToolRegistry::catalog() const {
    Json tools = Json::array();

    for (const auto& spec : get_all_specs()) {
        tools.push_back(spec.to_json_schema());
    }

    return tools;
}

Result<void, Error> ToolRegistry::validate_args(const ToolSpec& spec, const Json& args) const {
    if (!args.is_object()) {
        return Result<void, Error>::err(
            ErrorCode::ToolValidationFailed,
            "Arguments must be an object",
            spec.name
        );
    }

    // Check required parameters
    for (const auto& param : spec.parameters) {
        if (param.required && !args.contains(param.name)) {
            return Result<void, Error>::err(
                ErrorCode::ToolValidationFailed,
                "Missing required parameter: " + param.name,
                spec.name
            );
        }
    }

    // Validate parameter types
    for (const auto& param : spec.parameters) {
        if (!args.contains(param.name)) continue;

        const auto& value = args[param.name];
        bool valid = true;

        switch (param.type) {
            case ParamType::String:
                valid = value.is_string();
                break;
            case ParamType::Integer:
                valid = value.is_number_integer();
                break;
            case ParamType::Number:
                valid = value.is_number();
                break;
            case ParamType::Boolean:
                valid = value.is_boolean();
                break;
            case ParamType::Array:
                valid = value.is_array();
                break;
            case ParamType::Object:
                valid = value.is_object();
                break;
        }

        if (!valid) {
            return Result<void, Error>::err(
                ErrorCode::ToolValidationFailed,
                "Invalid type for parameter: " + param.name,
                spec.name
            );
        }

        // Check enum values
        if (param.enum_values && value.is_string()) {
            const auto& enum_vals = *param.enum_values;
            const auto& str_value = value.get<std::string>();
            if (std::find(enum_vals.begin(), enum_vals.end(), str_value) == enum_vals.end()) {
                return Result<void, Error>::err(
                    ErrorCode::ToolValidationFailed,
                    "Invalid enum value for parameter: " + param.name,
                    spec.name
                );
            }
        }
    }

    return Result<void, Error>::ok();
}

Result<Json, Error> ToolRegistry::execute(const ToolId& id, const Json& args) const {
    RegisteredTool tool;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = tools_.find(id);
        if (it == tools_.end()) {
            return Result<Json, Error>::err(
                ErrorCode::ToolNotFound,
                "Tool not found",
                id
            );
        }

        tool = it->second;
    }

    // Validate arguments
    auto validation = validate_args(tool.spec, args);
    if (validation.is_err()) {
        return Result<Json, Error>::err(std::move(validation).error());
    }

    // Execute the tool
    try {
        auto result = tool.handler(args);
        if (result.is_err()) {
            auto error = std::move(result).error();
            if (!error.context) {
                error.context = id;
            }
            return Result<Json, Error>::err(std::move(error));
        }

        const auto& output = result.value();
        if (output.is_object() && output.contains("error")) {
            const auto& detail = output["error"];
            return Result<Json, Error>::err(
                ErrorCode::ToolExecutionFailed,
                detail.is_string() ? detail.get<std::string>() : detail.dump(),
                id
            );
        }
        return result;

    } catch (const std::exception& e) {
        return Result<Json, Error>::err(
            ErrorCode::ToolExecutionFailed,
            e.what(),
            id
        );
    } catch (...) {
        return Result<Json, Error>::err(
            ErrorCode::ToolExecutionFailed,
            "Tool threw a non-standard exception",
            id
        );
    }
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

}  // namespace waypoint::tools
