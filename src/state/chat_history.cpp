#include "waypoint/state/chat_history.hpp"

#include <spdlog/spdlog.h>

namespace waypoint::state {

// ChatMessage
ChatMessage ChatMessage::user(std::string content) {
    return ChatMessage{MessageRole::User, std::move(content), now_timestamp()};
}

ChatMessage ChatMessage::assistant(std::string content) {
    return ChatMessage{MessageRole::Assistant, std::move(content), now_timestamp()};
}

Json ChatMessage::to_json() const {
    return Json{
        {"role", std::string(message_role_to_string(role))},
        {"content", content},
        {"timestamp", timestamp}
    };
}

Result<ChatMessage, Error> ChatMessage::from_json(const Json& j) {
    if (!j.is_object() || !j.contains("role") || !j["role"].is_string()) {
        return Result<ChatMessage, Error>::err(ErrorCode::StateCorrupted, "Chat message has no role");
    }

    ChatMessage msg;
    auto role = j["role"].get<std::string>();
    if (role == "user") {
        msg.role = MessageRole::User;
    } else if (role == "assistant") {
        msg.role = MessageRole::Assistant;
    } else {
        return Result<ChatMessage, Error>::err(ErrorCode::StateCorrupted, "Unknown chat role", role);
    }
    msg.content = j.value("content", "");
    msg.timestamp = j.value("timestamp", "");
    return Result<ChatMessage, Error>::ok(std::move(msg));
}

// ChatHistory
ChatHistory::ChatHistory(SessionStore& store, size_t limit)
    : store_(store)
    , limit_(limit)
{
}

std::shared_ptr<std::mutex> ChatHistory::session_lock(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& entry = locks_[session_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void ChatHistory::release_lock(const SessionId& session_id, std::shared_ptr<std::mutex> mutex) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = locks_.find(session_id);
    if (it != locks_.end() && it->second == mutex && mutex.use_count() == 2) {
        locks_.erase(it);
    }
}

size_t ChatHistory::active_sessions() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return locks_.size();
}

class ChatHistory::SessionGuard {
public:
    SessionGuard(ChatHistory& owner, const SessionId& session_id)
        : owner_(owner)
        , session_id_(session_id)
        , mutex_(owner.session_lock(session_id))
        , lock_(*mutex_)
    {
    }

    ~SessionGuard() {
        lock_.unlock();
        owner_.release_lock(session_id_, std::move(mutex_));
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

private:
    ChatHistory& owner_;
    SessionId session_id_;
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

Result<std::vector<ChatMessage>, Error> ChatHistory::read(const SessionId& session_id) {
    auto stored = store_.get(messages_key(session_id));
    if (stored.is_err()) {
        return Result<std::vector<ChatMessage>, Error>::err(std::move(stored).error());
    }

    std::vector<ChatMessage> messages;
    if (!stored.value()) {
        return Result<std::vector<ChatMessage>, Error>::ok(std::move(messages));
    }

    Json doc = Json::parse(*stored.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        return Result<std::vector<ChatMessage>, Error>::err(
            ErrorCode::StateCorrupted,
            "Stored chat history is not a JSON array",
            session_id
        );
    }

    messages.reserve(doc.size());
    for (const auto& entry : doc) {
        auto msg = ChatMessage::from_json(entry);
        if (msg.is_err()) {
            return Result<std::vector<ChatMessage>, Error>::err(std::move(msg).error());
        }
        messages.push_back(std::move(msg).value());
    }
    return Result<std::vector<ChatMessage>, Error>::ok(std::move(messages));
}

Result<void, Error> ChatHistory::write(const SessionId& session_id, std::vector<ChatMessage> messages) {
    if (messages.size() > limit_) {
        messages.erase(messages.begin(), messages.end() - static_cast<std::ptrdiff_t>(limit_));
    }

    Json doc = Json::array();
    for (const auto& msg : messages) {
        doc.push_back(msg.to_json());
    }

    auto written = store_.set(messages_key(session_id), doc.dump());
    if (written.is_err()) {
        return Result<void, Error>::err(
            ErrorCode::PersistenceFailed,
            written.error().full_message(),
            session_id
        );
    }
    return Result<void, Error>::ok();
}

Result<std::vector<ChatMessage>, Error> ChatHistory::load(const SessionId& session_id) {
    SessionGuard guard(*this, session_id);
    return read(session_id);
}

Result<std::vector<ChatMessage>, Error> ChatHistory::recent(const SessionId& session_id, size_t count) {
    auto messages = load(session_id);
    if (messages.is_err() || messages.value().size() <= count) {
        return messages;
    }

    auto& all = messages.value();
    std::vector<ChatMessage> tail(all.end() - static_cast<std::ptrdiff_t>(count), all.end());
    return Result<std::vector<ChatMessage>, Error>::ok(std::move(tail));
}

Result<void, Error> ChatHistory::append(const SessionId& session_id, ChatMessage message) {
    SessionGuard guard(*this, session_id);

    auto messages = read(session_id);
    if (messages.is_err()) {
        return Result<void, Error>::err(std::move(messages).error());
    }
    auto list = std::move(messages).value();
    list.push_back(std::move(message));
    return write(session_id, std::move(list));
}

Result<void, Error> ChatHistory::append_exchange(const SessionId& session_id,
                                                 const std::string& user_message,
                                                 const std::string& reply) {
    SessionGuard guard(*this, session_id);

    auto messages = read(session_id);
    if (messages.is_err()) {
        return Result<void, Error>::err(std::move(messages).error());
    }
    auto list = std::move(messages).value();
    list.push_back(ChatMessage::user(user_message));
    list.push_back(ChatMessage::assistant(reply));
    return write(session_id, std::move(list));
}

Result<void, Error> ChatHistory::clear(const SessionId& session_id) {
    SessionGuard guard(*this, session_id);

    auto removed = store_.remove(messages_key(session_id));
    if (removed.is_err()) {
        spdlog::error("Failed to clear chat history for {}: {}", session_id, removed.error().full_message());
        return removed;
    }
    return Result<void, Error>::ok();
}

}  // namespace waypoint::state
