#include <catch2/catch_test_macros.hpp>
#include "waypoint/state/merge.hpp"
#include "waypoint/state/state_template.hpp"

using namespace waypoint::state;

namespace {

State make_state(const Json& doc) {
    return State::from_json(doc).value();
}

Diff make_diff(const Json& j) {
    return Diff::from_json(j).value();
}

}  // namespace

TEST_CASE("Pending task becomes done with intent preserved", "[merge]") {
    auto s = make_state(Json{{"tasks", {
        {{"task_id", "t1"}, {"intent", "flight_search"}, {"status", "pending"}}
    }}});

    auto merged = merge(s, make_diff(Json{{"tasks", {{{"task_id", "t1"}, {"status", "done"}}}}}));

    REQUIRE(merged.is_ok());
    auto task = merged.value().find_task("t1");
    REQUIRE(task->status == TaskStatus::Done);
    REQUIRE(task->intent == "flight_search");
    REQUIRE(merged.value().task_count() == 1);
}

TEST_CASE("Merge is idempotent", "[merge]") {
    auto s = StateTemplate::builtin().instantiate().value();
    auto d = make_diff(Json{
        {"user_profile", {{"likes", {"jazz"}}, {"home", {{"address", "1 Main St"}}}}},
        {"travel_info", {{"poi", {"Louvre", "Orsay"}}, {"outbound", {{"seat_number", "12A"}}}}},
        {"tasks", {
            {{"task_id", "t1"}, {"intent", "poi_search"}, {"metadata", {{"tool", "poi"}}}},
            {{"task_id", "t2"}, {"status", "in_progress"}}
        }}
    });

    auto once = merge(s, d).value();
    auto twice = merge(once, d).value();

    REQUIRE(once == twice);
    REQUIRE(twice.task_count() == 2);
}

TEST_CASE("Partial update preserves untouched fields", "[merge]") {
    auto s = make_state(Json{{"travel_info", {
        {"origin", "SFO"},
        {"destination", "LIS"},
        {"outbound", {{"flight_selection", "TP238"}, {"seat_number", "3C"}}}
    }}});

    auto merged = merge(s, make_diff(Json{{"travel_info", {{"outbound", {{"seat_number", "4A"}}}}}})).value();

    const auto& info = merged.travel_info();
    REQUIRE(info["origin"] == "SFO");
    REQUIRE(info["destination"] == "LIS");
    REQUIRE(info["outbound"]["flight_selection"] == "TP238");
    REQUIRE(info["outbound"]["seat_number"] == "4A");
}

TEST_CASE("Sequences are replaced, not concatenated", "[merge]") {
    auto s = make_state(Json{{"user_profile", {{"allergies", {"nuts", "shellfish"}}}}});

    auto merged = merge(s, make_diff(Json{{"user_profile", {{"allergies", {"gluten"}}}}})).value();

    REQUIRE(merged.user_profile()["allergies"] == Json{"gluten"});
}

TEST_CASE("Empty diff is a no-op", "[merge]") {
    auto s = StateTemplate::builtin().instantiate().value();
    auto merged = merge(s, Diff{});

    REQUIRE(merged.is_ok());
    REQUIRE(merged.value() == s);
}

TEST_CASE("New tasks append in diff order", "[merge]") {
    auto s = make_state(Json{{"tasks", {{{"task_id", "a"}}}}});

    auto merged = merge(s, make_diff(Json{{"tasks", {
        {{"task_id", "c"}, {"intent", "hotel_search"}},
        {{"task_id", "a"}, {"intent", "updated"}},
        {{"task_id", "b"}}
    }}})).value();

    auto tasks = merged.tasks();
    REQUIRE(tasks.size() == 3);
    REQUIRE(tasks[0].task_id == "a");
    REQUIRE(tasks[0].intent == "updated");
    REQUIRE(tasks[1].task_id == "c");
    REQUIRE(tasks[1].status == TaskStatus::Pending);
    REQUIRE(tasks[2].task_id == "b");
}

TEST_CASE("Repeated task ids in one diff merge into one entry", "[merge]") {
    auto s = make_state(Json::object());

    Diff d;
    d.add_task(TaskPatch::status_update("t1", TaskStatus::InProgress));
    TaskPatch second = TaskPatch::status_update("t1", TaskStatus::Done);
    second.metadata.set("result", Json{{"ok", true}});
    d.add_task(second);

    auto merged = merge(s, d).value();

    REQUIRE(merged.task_count() == 1);
    REQUIRE(merged.find_task("t1")->status == TaskStatus::Done);
    REQUIRE(merged.find_task("t1")->metadata["result"]["ok"] == true);
}

TEST_CASE("Task metadata merges recursively", "[merge]") {
    auto s = make_state(Json{{"tasks", {
        {{"task_id", "t1"}, {"metadata", {{"tool", "flights"}, {"arguments", {{"origin", "SFO"}, {"date", "2026-05-01"}}}}}}
    }}});

    auto merged = merge(s, make_diff(Json{{"tasks", {
        {{"task_id", "t1"}, {"metadata", {{"arguments", {{"date", "2026-05-02"}}}, {"note", "moved"}}}}
    }}})).value();

    auto meta = merged.find_task("t1")->metadata;
    REQUIRE(meta["tool"] == "flights");
    REQUIRE(meta["arguments"]["origin"] == "SFO");
    REQUIRE(meta["arguments"]["date"] == "2026-05-02");
    REQUIRE(meta["note"] == "moved");
}

TEST_CASE("Nested diff replaces a non-mapping value", "[merge]") {
    auto s = make_state(Json{{"travel_info", {{"itinerary", "tbd"}}}});

    auto merged = merge(s, make_diff(Json{{"travel_info", {{"itinerary", {{"day1", "Sintra"}}}}}})).value();

    REQUIRE(merged.travel_info()["itinerary"] == Json{{"day1", "Sintra"}});
}

TEST_CASE("Deeply nested diff", "[merge]") {
    Json nested = Json{{"leaf", 1}};
    for (int i = 0; i < 200; ++i) {
        nested = Json{{"n", nested}};
    }

    auto merged = merge(State{}, make_diff(Json{{"travel_info", nested}}));

    REQUIRE(merged.is_ok());
    REQUIRE(merged.value().travel_info() == nested);
}

TEST_CASE("Status regression is rejected", "[merge]") {
    auto s = make_state(Json{{"tasks", {{{"task_id", "t1"}, {"status", "done"}}}}});

    SECTION("back to pending") {
        auto merged = merge(s, make_diff(Json{{"tasks", {{{"task_id", "t1"}, {"status", "pending"}}}}}));
        REQUIRE(merged.error().code == ErrorCode::InvalidStatusTransition);
    }

    SECTION("done to failed") {
        auto merged = merge(s, make_diff(Json{{"tasks", {{{"task_id", "t1"}, {"status", "failed"}}}}}));
        REQUIRE(merged.error().code == ErrorCode::InvalidStatusTransition);
    }

    SECTION("restating the same status is fine") {
        REQUIRE(merge(s, make_diff(Json{{"tasks", {{{"task_id", "t1"}, {"status", "done"}}}}})).is_ok());
    }
}

TEST_CASE("Rejected merge leaves the input untouched", "[merge]") {
    auto s = make_state(Json{
        {"travel_info", {{"origin", "SFO"}}},
        {"tasks", {{{"task_id", "t1"}, {"status", "done"}}}}
    });
    auto before = s.to_json();

    auto merged = merge(s, make_diff(Json{
        {"travel_info", {{"origin", "JFK"}}},
        {"tasks", {{{"task_id", "t1"}, {"status", "in_progress"}}}}
    }));

    REQUIRE(merged.is_err());
    REQUIRE(s.to_json() == before);
}

TEST_CASE("Unknown sections are rejected", "[merge]") {
    Diff d;
    d.set("weather", "rain");

    auto merged = merge(State{}, d);
    REQUIRE(merged.error().code == ErrorCode::DiffValidationFailed);
}
