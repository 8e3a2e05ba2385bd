#pragma once

#include "session_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace waypoint::state {

enum class MessageRole {
    User,
    Assistant
};

inline std::string_view message_role_to_string(MessageRole role) {
    return role == MessageRole::User ? "user" : "assistant";
}

struct ChatMessage {
    MessageRole role = MessageRole::User;
    std::string content;
    std::string timestamp;

    static ChatMessage user(std::string content);
    static ChatMessage assistant(std::string content);

    Json to_json() const;
    static Result<ChatMessage, Error> from_json(const Json& j);
};

// Per-session conversation log kept in the store under messages_{id}.
// Only the newest `limit` messages are retained.
class ChatHistory {
public:
    ChatHistory(SessionStore& store, size_t limit);

    Result<std::vector<ChatMessage>, Error> load(const SessionId& session_id);

    // Last `count` messages, oldest first
    Result<std::vector<ChatMessage>, Error> recent(const SessionId& session_id, size_t count);

    Result<void, Error> append(const SessionId& session_id, ChatMessage message);

    // User message and the reply to it, written together
    Result<void, Error> append_exchange(const SessionId& session_id,
                                        const std::string& user_message,
                                        const std::string& reply);

    Result<void, Error> clear(const SessionId& session_id);

    size_t limit() const { return limit_; }

    // Sessions with an operation in flight
    size_t active_sessions() const;

private:
    // Holds a session's lock for one operation; the lock entry is dropped
    // once nobody else is waiting on it
    class SessionGuard;

    SessionStore& store_;
    size_t limit_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<SessionId, std::shared_ptr<std::mutex>> locks_;

    std::shared_ptr<std::mutex> session_lock(const SessionId& session_id);
    void release_lock(const SessionId& session_id, std::shared_ptr<std::mutex> mutex);

    // Caller holds the session lock
    Result<std::vector<ChatMessage>, Error> read(const SessionId& session_id);
    Result<void, Error> write(const SessionId& session_id, std::vector<ChatMessage> messages);
};

}  // namespace waypoint::state
