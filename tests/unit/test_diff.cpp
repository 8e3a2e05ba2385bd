#include <catch2/catch_test_macros.hpp>
#include "waypoint/state/diff.hpp"
#include "waypoint/state/diff_builder.hpp"

using namespace waypoint::state;

TEST_CASE("Diff from JSON picks node kinds", "[diff]") {
    auto diff = Diff::from_json(Json{
        {"user_profile", {{"likes", {"museums", "food"}}}},
        {"travel_info", {{"destination", "Kyoto"}}},
        {"tasks", {{{"task_id", "t1"}, {"status", "done"}}}}
    });

    REQUIRE(diff.is_ok());
    const auto& d = diff.value();
    REQUIRE(d.size() == 3);
    REQUIRE(d.find("travel_info")->kind() == DiffNode::Kind::Nested);
    REQUIRE(d.find("tasks")->kind() == DiffNode::Kind::TaskList);

    const auto& profile = d.find("user_profile")->as_nested();
    REQUIRE(profile.find("likes")->kind() == DiffNode::Kind::Value);
    REQUIRE(profile.find("likes")->as_value() == Json{"museums", "food"});

    const auto& patches = d.find("tasks")->as_task_list();
    REQUIRE(patches.size() == 1);
    REQUIRE(patches[0].status == TaskStatus::Done);
    REQUIRE_FALSE(patches[0].intent.has_value());
}

TEST_CASE("Diff JSON round trip", "[diff]") {
    Json source{
        {"travel_info", {{"hotel", {{"hotel_selection", "Ritz"}}}}},
        {"tasks", {{{"task_id", "t1"}, {"intent", "hotel_search"}, {"metadata", {{"tool", "hotels"}}}}}}
    };

    auto diff = Diff::from_json(source);
    REQUIRE(diff.is_ok());
    REQUIRE(diff.value().to_json() == source);
}

TEST_CASE("Task entries are checked", "[diff]") {
    SECTION("missing task_id") {
        auto diff = Diff::from_json(Json{{"tasks", {{{"intent", "x"}}}}});
        REQUIRE(diff.error().code == ErrorCode::DiffValidationFailed);
    }

    SECTION("empty task_id") {
        REQUIRE(Diff::from_json(Json{{"tasks", {{{"task_id", ""}}}}}).is_err());
    }

    SECTION("unknown field") {
        auto diff = Diff::from_json(Json{{"tasks", {{{"task_id", "t1"}, {"owner", "me"}}}}});
        REQUIRE(diff.is_err());
        REQUIRE(diff.error().context == "t1");
    }

    SECTION("unknown status") {
        REQUIRE(Diff::from_json(Json{{"tasks", {{{"task_id", "t1"}, {"status", "paused"}}}}}).is_err());
    }

    SECTION("non-string field") {
        REQUIRE(Diff::from_json(Json{{"tasks", {{{"task_id", "t1"}, {"intent", 3}}}}}).is_err());
    }
}

TEST_CASE("Diff must be an object", "[diff]") {
    REQUIRE(Diff::from_json(Json::array()).is_err());
    REQUIRE(Diff::from_json(Json::object()).value().empty());
}

TEST_CASE("Diff task ids keep order without repeats", "[diff]") {
    Diff diff;
    diff.add_task(TaskPatch::status_update("b", TaskStatus::Done));
    diff.add_task(TaskPatch::status_update("a", TaskStatus::Done));
    diff.add_task(TaskPatch::status_update("b", TaskStatus::Done));

    REQUIRE(diff.task_ids() == std::vector<TaskId>{"b", "a"});
}

TEST_CASE("Diff overlay", "[diff]") {
    Diff base;
    base.nest("travel_info", Diff().set("origin", "SFO").set("destination", "LIS"));
    base.add_task(TaskPatch::status_update("t1", TaskStatus::Done));

    Diff top;
    top.nest("travel_info", Diff().set("destination", "OPO"));
    top.add_task(TaskPatch::status_update("t2", TaskStatus::Pending));
    top.set("user_profile", Json{{"seat_preference", "aisle"}});

    auto combined = base.overlay(top).to_json();

    REQUIRE(combined["travel_info"]["origin"] == "SFO");
    REQUIRE(combined["travel_info"]["destination"] == "OPO");
    REQUIRE(combined["tasks"].size() == 2);
    REQUIRE(combined["tasks"][0]["task_id"] == "t1");
    REQUIRE(combined["tasks"][1]["task_id"] == "t2");
    REQUIRE(combined["user_profile"]["seat_preference"] == "aisle");
}

TEST_CASE("Overlay folds patches for the same task", "[diff]") {
    Diff base;
    TaskPatch failed = TaskPatch::status_update("t1", TaskStatus::Failed);
    failed.metadata.set("error", Json{{"message", "timeout"}});
    base.add_task(failed);

    Diff top;
    top.add_task(TaskPatch::status_update("t1", TaskStatus::Done));

    auto combined = base.overlay(top).to_json();

    REQUIRE(combined["tasks"].size() == 1);
    REQUIRE(combined["tasks"][0]["status"] == "done");
    REQUIRE(combined["tasks"][0]["metadata"]["error"]["message"] == "timeout");
}

TEST_CASE("Diff builder", "[diff]") {
    DiffBuilder builder;

    SECTION("propose validates top-level sections") {
        REQUIRE(builder.propose(Json{{"travel_info", {{"origin", "SFO"}}}}).is_ok());
        REQUIRE(builder.propose(Json{{"weather", "sunny"}}).error().code == ErrorCode::DiffValidationFailed);
        REQUIRE(builder.propose(Json{{"tasks", "none"}}).is_err());
        REQUIRE(builder.propose(Json{{"travel_info", 5}}).is_err());
    }

    SECTION("add_task restates every field") {
        Task task;
        task.task_id = "t1";
        task.intent = "flight_search";
        task.agent_origin = "travel_planner";
        task.metadata = Json{{"tool", "flights"}};

        auto j = builder.add_task(task).to_json();
        REQUIRE(j["tasks"][0]["intent"] == "flight_search");
        REQUIRE(j["tasks"][0]["status"] == "pending");
        REQUIRE(j["tasks"][0]["metadata"]["tool"] == "flights");
    }

    SECTION("annotate_task needs a mapping") {
        REQUIRE(builder.annotate_task("t1", Json{{"note", "cheap"}}).is_ok());
        REQUIRE(builder.annotate_task("t1", Json::array()).is_err());
        REQUIRE(builder.annotate_task("", Json::object()).is_err());
    }

    SECTION("section updates nest under their key") {
        auto diff = builder.update_user_profile(Json{{"allergies", {"nuts"}}});
        REQUIRE(diff.is_ok());
        REQUIRE(diff.value().find("user_profile")->kind() == DiffNode::Kind::Nested);
        REQUIRE(builder.update_travel_info(Json("Paris")).is_err());
    }

    SECTION("results become status updates") {
        TaskResult ok;
        ok.task_id = "a";
        ok.status = TaskStatus::Done;
        ok.output = Json{{"price", 120}};

        TaskResult bad;
        bad.task_id = "b";
        bad.status = TaskStatus::Failed;
        bad.error = Error{ErrorCode::ToolTimeout, "slow", "b"};

        auto j = builder.from_results({ok, bad}).to_json();
        REQUIRE(j["tasks"][0]["status"] == "done");
        REQUIRE(j["tasks"][0]["metadata"]["result"]["price"] == 120);
        REQUIRE(j["tasks"][1]["status"] == "failed");
        REQUIRE(j["tasks"][1]["metadata"]["error"]["code"] == static_cast<int>(ErrorCode::ToolTimeout));
    }
}

TEST_CASE("Only the top-level tasks key is a task list", "[diff]") {
    auto diff = Diff::from_json(Json{{"travel_info", {{"tasks", {"pack", "check in"}}}}});

    REQUIRE(diff.is_ok());
    const auto& info = diff.value().find("travel_info")->as_nested();
    REQUIRE(info.find("tasks")->kind() == DiffNode::Kind::Value);
}
