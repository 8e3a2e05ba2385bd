#include "waypoint/state/state_template.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace waypoint::state {

StateTemplate StateTemplate::builtin() {
    StateTemplate t;
    t.version_ = 1;
    t.state_ = Json{
        {"user_profile", {
            {"passport_nationality", ""},
            {"seat_preference", ""},
            {"food_preference", ""},
            {"allergies", Json::array()},
            {"likes", Json::array()},
            {"dislikes", Json::array()},
            {"price_sensitivity", Json::array()},
            {"home", {
                {"event_type", "home"},
                {"address", ""},
                {"local_prefer_mode", ""}
            }}
        }},
        {"tasks", Json::array()},
        {"travel_info", {
            {"origin", ""},
            {"destination", ""},
            {"start_date", ""},
            {"end_date", ""},
            {"itinerary", Json::object()},
            {"outbound", {
                {"flight_selection", ""},
                {"seat_number", ""}
            }},
            {"return", {
                {"flight_selection", ""},
                {"seat_number", ""}
            }},
            {"hotel", {
                {"hotel_selection", ""},
                {"room_selection", ""}
            }},
            {"poi", Json::array()},
            {"itinerary_datetime", ""},
            {"itinerary_start_date", ""},
            {"itinerary_end_date", ""}
        }}
    };
    return t;
}

Result<StateTemplate, Error> StateTemplate::from_json(const Json& j) {
    if (!j.is_object() || !j.contains("state") || !j["state"].is_object()) {
        return Result<StateTemplate, Error>::err(
            ErrorCode::TemplateInvalid,
            "Template must be an object with a \"state\" mapping"
        );
    }
    if (j.contains("version") && !j["version"].is_number_integer()) {
        return Result<StateTemplate, Error>::err(
            ErrorCode::TemplateInvalid,
            "Template version must be an integer"
        );
    }

    StateTemplate t;
    t.version_ = j.value("version", 1);
    t.state_ = j["state"];

    // The document has to produce a valid State
    auto check = t.instantiate();
    if (check.is_err()) {
        return Result<StateTemplate, Error>::err(
            ErrorCode::TemplateInvalid,
            check.error().message,
            check.error().context.value_or("state")
        );
    }

    return Result<StateTemplate, Error>::ok(std::move(t));
}

Result<StateTemplate, Error> StateTemplate::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<StateTemplate, Error>::err(
            ErrorCode::FileNotFound,
            "Template file not found",
            path.string()
        );
    }

    std::ifstream file(path);
    if (!file) {
        return Result<StateTemplate, Error>::err(
            ErrorCode::FileReadFailed,
            "Failed to open template file",
            path.string()
        );
    }

    Json j;
    try {
        file >> j;
    } catch (const Json::parse_error& e) {
        return Result<StateTemplate, Error>::err(
            ErrorCode::TemplateInvalid,
            std::string("Template is not valid JSON: ") + e.what(),
            path.string()
        );
    }

    return from_json(j);
}

Result<StateTemplate, Error> StateTemplate::resolve(const fs::path& path) {
    if (path.empty()) {
        return Result<StateTemplate, Error>::ok(builtin());
    }
    auto loaded = load(path);
    if (loaded.is_ok()) {
        spdlog::info("Loaded state template v{} from {}", loaded.value().version(), path.string());
    }
    return loaded;
}

Result<State, Error> StateTemplate::instantiate() const {
    return State::from_json(state_);
}

Json StateTemplate::to_json() const {
    return Json{
        {"version", version_},
        {"state", state_}
    };
}

}  // namespace waypoint::state
