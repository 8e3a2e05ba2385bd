#include <catch2/catch_test_macros.hpp>
#include "waypoint/state/state_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <thread>

using namespace waypoint::state;

namespace {

// Store with switchable write failures
class FlakyStore : public InMemorySessionStore {
public:
    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_reads{false};

    Result<std::optional<std::string>, Error> get(const std::string& key) override {
        if (fail_reads) {
            return Result<std::optional<std::string>, Error>::err(ErrorCode::FileReadFailed, "disk gone");
        }
        return InMemorySessionStore::get(key);
    }

    Result<void, Error> set(const std::string& key, const std::string& value) override {
        if (fail_writes) {
            return Result<void, Error>::err(ErrorCode::FileWriteFailed, "disk full");
        }
        return InMemorySessionStore::set(key, value);
    }
};

// Store whose writes park until released
class GatedStore : public InMemorySessionStore {
public:
    Result<void, Error> set(const std::string& key, const std::string& value) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
        }
        return InMemorySessionStore::set(key, value);
    }

    void wait_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

StateConfig fast_config() {
    StateConfig config;
    config.lock_timeout_ms = 2000;
    return config;
}

Diff task_diff(const std::string& id) {
    Task task;
    task.task_id = id;
    task.intent = "search";
    return DiffBuilder{}.add_task(task);
}

}  // namespace

TEST_CASE("Load builds state from the template", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    auto state = manager.load("s1");

    REQUIRE(state.is_ok());
    REQUIRE(state.value() == StateTemplate::builtin().instantiate().value());
    REQUIRE(store.size() == 0);
}

TEST_CASE("Commit persists and is visible to readers", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    auto committed = manager.commit("s1", task_diff("t1"));
    REQUIRE(committed.is_ok());
    REQUIRE(manager.get_state("s1").value().has_task("t1"));

    auto stored = store.get(state_key("s1")).value();
    REQUIRE(stored.has_value());
    REQUIRE(Json::parse(*stored) == committed.value().to_json());

    // A fresh manager over the same store picks the state up
    StateManager other(store, StateTemplate::builtin(), fast_config());
    REQUIRE(other.get_state("s1").value() == committed.value());
}

TEST_CASE("Concurrent commits are serialized without lost updates", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    constexpr int N = 32;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            if (manager.commit("shared", task_diff("t" + std::to_string(i))).is_err()) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(failures.load() == 0);
    auto state = manager.get_state("shared").value();
    REQUIRE(state.task_count() == N);
    REQUIRE(manager.stats().commits == N);
}

TEST_CASE("Sessions are isolated", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    REQUIRE(manager.commit("a", task_diff("only_in_a")).is_ok());
    REQUIRE(manager.update_travel_info("b", Json{{"destination", "Oslo"}}).is_ok());

    auto a = manager.get_state("a").value();
    auto b = manager.get_state("b").value();
    REQUIRE(a.has_task("only_in_a"));
    REQUIRE_FALSE(b.has_task("only_in_a"));
    REQUIRE(a.travel_info()["destination"] == "");
    REQUIRE(b.travel_info()["destination"] == "Oslo");
}

TEST_CASE("A busy session does not block other sessions", "[state_manager]") {
    GatedStore store;
    StateConfig config;
    config.lock_timeout_ms = 100;
    StateManager manager(store, StateTemplate::builtin(), config);

    auto blocked = std::async(std::launch::async, [&] { return manager.commit("slow", task_diff("t1")); });
    store.wait_entered();

    // Same session: the lock is held for the whole merge + persist
    auto timed_out = manager.commit("slow", task_diff("t2"));
    REQUIRE(timed_out.error().code == ErrorCode::ConcurrencyTimeout);
    REQUIRE(manager.stats().lock_timeouts == 1);

    // Other session: only needs its own lock
    REQUIRE(manager.load("other").is_ok());

    store.release();
    REQUIRE(blocked.get().is_ok());
    REQUIRE(manager.get_state("slow").value().has_task("t1"));
    REQUIRE_FALSE(manager.get_state("slow").value().has_task("t2"));
}

TEST_CASE("Failed persistence leaves state unchanged", "[state_manager]") {
    FlakyStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    REQUIRE(manager.commit("s1", task_diff("t1")).is_ok());
    auto before = manager.get_state("s1").value();

    store.fail_writes = true;
    auto failed = manager.commit("s1", task_diff("t2"));

    REQUIRE(failed.error().code == ErrorCode::PersistenceFailed);
    REQUIRE(manager.get_state("s1").value() == before);
    REQUIRE(manager.stats().persistence_failures == 1);

    store.fail_writes = false;
    REQUIRE(manager.commit("s1", task_diff("t2")).value().task_count() == 2);
}

TEST_CASE("Rejected diff leaves state unchanged", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    REQUIRE(manager.commit("s1", DiffBuilder{}.update_task_status("t1", TaskStatus::Done)).is_ok());
    auto before = manager.get_state("s1").value();

    auto regressed = manager.commit("s1", DiffBuilder{}.update_task_status("t1", TaskStatus::Pending));
    REQUIRE(regressed.error().code == ErrorCode::InvalidStatusTransition);
    REQUIRE(manager.get_state("s1").value() == before);
    REQUIRE(manager.stats().rejected_commits == 1);
}

TEST_CASE("Read failures and corrupted state surface as errors", "[state_manager]") {
    FlakyStore store;

    SECTION("read failure") {
        StateManager manager(store, StateTemplate::builtin(), fast_config());
        store.fail_reads = true;
        REQUIRE(manager.load("s1").error().code == ErrorCode::StoreReadFailed);
    }

    SECTION("not JSON") {
        REQUIRE(store.set(state_key("s1"), "{not json").is_ok());
        StateManager manager(store, StateTemplate::builtin(), fast_config());
        REQUIRE(manager.load("s1").error().code == ErrorCode::StateCorrupted);
    }

    SECTION("wrong shape") {
        REQUIRE(store.set(state_key("s1"), R"({"tasks": {}})").is_ok());
        StateManager manager(store, StateTemplate::builtin(), fast_config());
        REQUIRE(manager.load("s1").error().code == ErrorCode::StateCorrupted);
    }
}

TEST_CASE("Snapshots are independent of later commits", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    auto snapshot = manager.get_state("s1").value();
    REQUIRE(manager.commit("s1", task_diff("t1")).is_ok());

    REQUIRE(snapshot.task_count() == 0);
    REQUIRE(manager.get_state("s1").value().task_count() == 1);
}

TEST_CASE("add_task fills generated fields", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    Task task;
    task.intent = "hotel_search";
    auto state = manager.add_task("s1", task);

    REQUIRE(state.is_ok());
    auto added = state.value().tasks().at(0);
    REQUIRE(added.task_id.rfind("task_", 0) == 0);
    REQUIRE_FALSE(added.timestamp.empty());
    REQUIRE(added.status == TaskStatus::Pending);
    REQUIRE(added.intent == "hotel_search");
}

TEST_CASE("Profile updates merge into the existing profile", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    REQUIRE(manager.update_user_profile("s1", Json{{"seat_preference", "window"}}).is_ok());
    auto state = manager.update_user_profile("s1", Json{{"likes", {"wine"}}}).value();

    REQUIRE(state.user_profile()["seat_preference"] == "window");
    REQUIRE(state.user_profile()["likes"] == Json{"wine"});
    REQUIRE(state.user_profile()["home"]["event_type"] == "home");
}

TEST_CASE("Clear drops stored and in-memory state", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    REQUIRE(manager.commit("s1", task_diff("t1")).is_ok());
    REQUIRE(manager.clear("s1").is_ok());
    REQUIRE(manager.stats().cached_sessions == 0);

    REQUIRE_FALSE(store.get(state_key("s1")).value().has_value());
    REQUIRE(manager.get_state("s1").value().task_count() == 0);
}

TEST_CASE("Idle sessions can be evicted from the cache", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    REQUIRE(manager.commit("s1", task_diff("t1")).is_ok());
    REQUIRE(manager.load("s2").is_ok());
    REQUIRE(manager.stats().cached_sessions == 2);

    REQUIRE(manager.evict("s1"));
    REQUIRE_FALSE(manager.evict("s1"));
    REQUIRE_FALSE(manager.evict("never_seen"));
    REQUIRE(manager.stats().cached_sessions == 1);

    // Reloaded from the store on next access
    REQUIRE(manager.get_state("s1").value().has_task("t1"));
    REQUIRE(manager.stats().cached_sessions == 2);
}

TEST_CASE("A session mid-commit is not evicted", "[state_manager]") {
    GatedStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    auto blocked = std::async(std::launch::async, [&] { return manager.commit("s1", task_diff("t1")); });
    store.wait_entered();

    REQUIRE_FALSE(manager.evict("s1"));

    store.release();
    REQUIRE(blocked.get().is_ok());
    REQUIRE(manager.evict("s1"));
    REQUIRE(manager.get_state("s1").value().has_task("t1"));
}

TEST_CASE("propose_diff does not touch state", "[state_manager]") {
    InMemorySessionStore store;
    StateManager manager(store, StateTemplate::builtin(), fast_config());

    auto diff = manager.propose_diff(Json{{"travel_info", {{"origin", "SFO"}}}});
    REQUIRE(diff.is_ok());
    REQUIRE(store.size() == 0);
    REQUIRE(manager.stats().commits == 0);
}
