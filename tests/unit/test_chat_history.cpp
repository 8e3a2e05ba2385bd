#include <catch2/catch_test_macros.hpp>
#include "waypoint/state/chat_history.hpp"

#include <thread>
#include <vector>

using namespace waypoint::state;

TEST_CASE("Chat history starts empty", "[chat_history]") {
    InMemorySessionStore store;
    ChatHistory history(store, 10);

    auto messages = history.load("s1");
    REQUIRE(messages.is_ok());
    REQUIRE(messages.value().empty());
}

TEST_CASE("Exchanges are appended in order", "[chat_history]") {
    InMemorySessionStore store;
    ChatHistory history(store, 10);

    REQUIRE(history.append_exchange("s1", "Find me a flight", "Which dates?").is_ok());
    REQUIRE(history.append("s1", ChatMessage::user("May 3rd")).is_ok());

    auto messages = history.load("s1").value();
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0].role == MessageRole::User);
    REQUIRE(messages[0].content == "Find me a flight");
    REQUIRE(messages[1].role == MessageRole::Assistant);
    REQUIRE(messages[2].content == "May 3rd");
    REQUIRE_FALSE(messages[2].timestamp.empty());

    auto stored = Json::parse(*store.get(messages_key("s1")).value());
    REQUIRE(stored.size() == 3);
    REQUIRE(stored[1]["role"] == "assistant");
}

TEST_CASE("History is capped at the limit", "[chat_history]") {
    InMemorySessionStore store;
    ChatHistory history(store, 4);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(history.append_exchange("s1", "q" + std::to_string(i), "a" + std::to_string(i)).is_ok());
    }

    auto messages = history.load("s1").value();
    REQUIRE(messages.size() == 4);
    REQUIRE(messages.front().content == "q3");
    REQUIRE(messages.back().content == "a4");

    auto recent = history.recent("s1", 2).value();
    REQUIRE(recent.size() == 2);
    REQUIRE(recent[0].content == "q4");
    REQUIRE(recent[1].content == "a4");
}

TEST_CASE("Concurrent appends to one session are not lost", "[chat_history]") {
    InMemorySessionStore store;
    ChatHistory history(store, 100);

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&history, i] {
            auto appended = history.append("s1", ChatMessage::user("m" + std::to_string(i)));
            (void)appended;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(history.load("s1").value().size() == 10);
    REQUIRE(history.active_sessions() == 0);
}

TEST_CASE("Session locks are dropped after each operation", "[chat_history]") {
    InMemorySessionStore store;
    ChatHistory history(store, 10);

    for (int i = 0; i < 50; ++i) {
        auto id = "s" + std::to_string(i);
        REQUIRE(history.append(id, ChatMessage::user("hi")).is_ok());
        REQUIRE(history.load(id).value().size() == 1);
    }
    REQUIRE(history.active_sessions() == 0);

    REQUIRE(history.clear("s0").is_ok());
    REQUIRE(history.active_sessions() == 0);
    REQUIRE(history.load("s1").value().size() == 1);
}

TEST_CASE("Clear and corrupted history", "[chat_history]") {
    InMemorySessionStore store;
    ChatHistory history(store, 10);

    REQUIRE(history.append_exchange("s1", "hi", "hello").is_ok());
    REQUIRE(history.clear("s1").is_ok());
    REQUIRE(history.load("s1").value().empty());

    REQUIRE(store.set(messages_key("s2"), R"({"role":"user"})").is_ok());
    REQUIRE(history.load("s2").error().code == ErrorCode::StateCorrupted);

    REQUIRE(store.set(messages_key("s3"), R"([{"role":"system","content":"x"}])").is_ok());
    REQUIRE(history.load("s3").is_err());
}
