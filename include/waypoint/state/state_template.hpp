#pragma once

#include "state_model.hpp"

#include <filesystem>

namespace waypoint::state {

// Versioned starting document for new sessions: {"version": N, "state": {...}}
class StateTemplate {
public:
    // Default travel-planning shape: empty profile and itinerary fields, no tasks
    static StateTemplate builtin();

    static Result<StateTemplate, Error> load(const fs::path& path);
    static Result<StateTemplate, Error> from_json(const Json& j);

    // Template path from config, or the built-in one when the path is empty
    static Result<StateTemplate, Error> resolve(const fs::path& path);

    int version() const { return version_; }
    const Json& document() const { return state_; }

    // Fresh State built from the template document
    Result<State, Error> instantiate() const;

    Json to_json() const;

private:
    int version_ = 1;
    Json state_ = Json::object();
};

}  // namespace waypoint::state
