#include "waypoint/state/state_manager.hpp"
#include "waypoint/state/merge.hpp"
#include "waypoint/core/uuid.hpp"

#include <spdlog/spdlog.h>

namespace waypoint::state {

StateManager::StateManager(SessionStore& store, StateTemplate state_template, const StateConfig& config)
    : store_(store)
    , template_(std::move(state_template))
    , lock_timeout_(config.lock_timeout_ms)
{
}

std::shared_ptr<StateManager::SessionSlot> StateManager::slot(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& entry = sessions_[session_id];
    if (!entry) {
        entry = std::make_shared<SessionSlot>();
    }
    return entry;
}

bool StateManager::release(const SessionId& session_id, std::shared_ptr<SessionSlot> session) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second != session || session.use_count() > 2) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

Error StateManager::lock_timeout(const SessionId& session_id) {
    ++lock_timeouts_;
    spdlog::warn("Timed out after {}ms waiting for session {}", lock_timeout_.count(), session_id);
    return Error{ErrorCode::ConcurrencyTimeout, "Session is busy", session_id};
}

Result<void, Error> StateManager::ensure_loaded(SessionSlot& slot, const SessionId& session_id) {
    if (slot.state) {
        return Result<void, Error>::ok();
    }

    auto stored = store_.get(state_key(session_id));
    if (stored.is_err()) {
        auto error = std::move(stored).error();
        spdlog::error("Failed to read state for session {}: {}", session_id, error.full_message());
        return Result<void, Error>::err(
            ErrorCode::StoreReadFailed,
            error.full_message(),
            session_id
        );
    }

    if (!stored.value()) {
        auto fresh = template_.instantiate();
        if (fresh.is_err()) {
            return Result<void, Error>::err(std::move(fresh).error());
        }
        slot.state = std::move(fresh).value();
        spdlog::debug("Session {} initialized from template v{}", session_id, template_.version());
        return Result<void, Error>::ok();
    }

    Json doc = Json::parse(*stored.value(), nullptr, false);
    if (doc.is_discarded()) {
        return Result<void, Error>::err(
            ErrorCode::StateCorrupted,
            "Stored state is not valid JSON",
            session_id
        );
    }

    auto state = State::from_json(doc);
    if (state.is_err()) {
        auto error = std::move(state).error();
        spdlog::error("Stored state for session {} is corrupted: {}", session_id, error.full_message());
        error.context = session_id + ": " + error.context.value_or("");
        return Result<void, Error>::err(std::move(error));
    }

    slot.state = std::move(state).value();
    return Result<void, Error>::ok();
}

Result<State, Error> StateManager::load(const SessionId& session_id) {
    auto session = slot(session_id);

    {
        std::shared_lock<std::shared_timed_mutex> lock(session->mutex, std::defer_lock);
        if (!lock.try_lock_for(lock_timeout_)) {
            return Result<State, Error>::err(lock_timeout(session_id));
        }
        if (session->state) {
            return Result<State, Error>::ok(*session->state);
        }
    }

    std::unique_lock<std::shared_timed_mutex> lock(session->mutex, std::defer_lock);
    if (!lock.try_lock_for(lock_timeout_)) {
        return Result<State, Error>::err(lock_timeout(session_id));
    }

    auto loaded = ensure_loaded(*session, session_id);
    if (loaded.is_err()) {
        return Result<State, Error>::err(std::move(loaded).error());
    }
    return Result<State, Error>::ok(*session->state);
}

Result<State, Error> StateManager::get_state(const SessionId& session_id) {
    // State holds its document by value, so every copy handed out is deep
    return load(session_id);
}

Result<State, Error> StateManager::commit(const SessionId& session_id, const Diff& diff) {
    auto session = slot(session_id);

    std::unique_lock<std::shared_timed_mutex> lock(session->mutex, std::defer_lock);
    if (!lock.try_lock_for(lock_timeout_)) {
        return Result<State, Error>::err(lock_timeout(session_id));
    }

    auto loaded = ensure_loaded(*session, session_id);
    if (loaded.is_err()) {
        return Result<State, Error>::err(std::move(loaded).error());
    }

    auto merged = merge(*session->state, diff);
    if (merged.is_err()) {
        ++rejected_commits_;
        spdlog::warn("Rejected diff for session {}: {}", session_id, merged.error().full_message());
        return merged;
    }

    auto persisted = store_.set(state_key(session_id), merged.value().to_json().dump());
    if (persisted.is_err()) {
        ++persistence_failures_;
        auto cause = std::move(persisted).error();
        spdlog::error("Failed to persist session {}: {}", session_id, cause.full_message());
        Error error{ErrorCode::PersistenceFailed, cause.full_message(), session_id};
        error.source = "session_store";
        return Result<State, Error>::err(std::move(error));
    }

    session->state = merged.value();
    ++commits_;
    spdlog::debug("Committed {} field(s) to session {} ({} tasks)",
                  diff.size(), session_id, session->state->task_count());

    return merged;
}

Result<State, Error> StateManager::add_task(const SessionId& session_id, Task task) {
    if (task.task_id.empty()) {
        task.task_id = generate_task_id();
    }
    if (task.timestamp.empty()) {
        task.timestamp = now_timestamp();
    }
    return commit(session_id, builder_.add_task(task));
}

Result<State, Error> StateManager::update_travel_info(const SessionId& session_id, const Json& updates) {
    auto diff = builder_.update_travel_info(updates);
    if (diff.is_err()) {
        return Result<State, Error>::err(std::move(diff).error());
    }
    return commit(session_id, diff.value());
}

Result<State, Error> StateManager::update_user_profile(const SessionId& session_id, const Json& updates) {
    auto diff = builder_.update_user_profile(updates);
    if (diff.is_err()) {
        return Result<State, Error>::err(std::move(diff).error());
    }
    return commit(session_id, diff.value());
}

Result<void, Error> StateManager::clear(const SessionId& session_id) {
    auto session = slot(session_id);

    {
        std::unique_lock<std::shared_timed_mutex> lock(session->mutex, std::defer_lock);
        if (!lock.try_lock_for(lock_timeout_)) {
            return Result<void, Error>::err(lock_timeout(session_id));
        }

        auto removed = store_.remove(state_key(session_id));
        if (removed.is_err()) {
            auto cause = std::move(removed).error();
            spdlog::error("Failed to clear session {}: {}", session_id, cause.full_message());
            return Result<void, Error>::err(ErrorCode::PersistenceFailed, cause.full_message(), session_id);
        }

        session->state.reset();
    }

    release(session_id, std::move(session));
    spdlog::info("Cleared session {}", session_id);
    return Result<void, Error>::ok();
}

bool StateManager::evict(const SessionId& session_id) {
    std::shared_ptr<SessionSlot> session;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
    }

    {
        // A holder of the lock is mid-operation
        std::unique_lock<std::shared_timed_mutex> lock(session->mutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            return false;
        }
    }

    if (!release(session_id, std::move(session))) {
        return false;
    }
    spdlog::debug("Evicted session {} from cache", session_id);
    return true;
}

StateManager::Stats StateManager::stats() const {
    size_t cached = 0;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        cached = sessions_.size();
    }
    return Stats{
        .commits = commits_.load(),
        .rejected_commits = rejected_commits_.load(),
        .lock_timeouts = lock_timeouts_.load(),
        .persistence_failures = persistence_failures_.load(),
        .cached_sessions = cached
    };
}

}  // namespace waypoint::state
