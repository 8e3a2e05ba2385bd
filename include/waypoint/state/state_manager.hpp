#pragma once

#include "diff_builder.hpp"
#include "session_store.hpp"
#include "state_template.hpp"
#include "waypoint/core/config.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace waypoint::state {

// Owns the canonical State of every session and is the only thing that
// changes it. Commits to one session are serialized on that session's lock;
// sessions never share a lock.
class StateManager {
public:
    StateManager(SessionStore& store, StateTemplate state_template, const StateConfig& config);

    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    // Canonical state, read from the store or built from the template on
    // first access
    Result<State, Error> load(const SessionId& session_id);

    // Independent snapshot; later commits do not affect it
    Result<State, Error> get_state(const SessionId& session_id);

    // Merge `diff` into the session's state and persist it. On any failure
    // (validation, lock timeout, store write) the canonical state is left
    // exactly as it was.
    Result<State, Error> commit(const SessionId& session_id, const Diff& diff);

    Result<Diff, Error> propose_diff(const Json& candidate) const { return builder_.propose(candidate); }
    const DiffBuilder& diff_builder() const { return builder_; }

    // Convenience writers. add_task fills a missing task_id and timestamp.
    Result<State, Error> add_task(const SessionId& session_id, Task task);
    Result<State, Error> update_travel_info(const SessionId& session_id, const Json& updates);
    Result<State, Error> update_user_profile(const SessionId& session_id, const Json& updates);

    // Remove the stored state and drop the in-memory copy
    Result<void, Error> clear(const SessionId& session_id);

    // Drop the cached copy of an idle session; the stored state is kept and
    // the next access reloads it. Returns false if the session is in use.
    bool evict(const SessionId& session_id);

    struct Stats {
        size_t commits = 0;
        size_t rejected_commits = 0;
        size_t lock_timeouts = 0;
        size_t persistence_failures = 0;
        size_t cached_sessions = 0;
    };
    Stats stats() const;

private:
    struct SessionSlot {
        std::shared_timed_mutex mutex;
        std::optional<State> state;
    };

    SessionStore& store_;
    StateTemplate template_;
    std::chrono::milliseconds lock_timeout_;
    DiffBuilder builder_;

    // Guards only the map, never held while a session lock is taken
    mutable std::mutex registry_mutex_;
    std::unordered_map<SessionId, std::shared_ptr<SessionSlot>> sessions_;

    std::atomic<size_t> commits_{0};
    std::atomic<size_t> rejected_commits_{0};
    std::atomic<size_t> lock_timeouts_{0};
    std::atomic<size_t> persistence_failures_{0};

    std::shared_ptr<SessionSlot> slot(const SessionId& session_id);

    // Erase the registry entry if `session` is its only other holder
    bool release(const SessionId& session_id, std::shared_ptr<SessionSlot> session);

    // Caller holds the slot's exclusive lock
    Result<void, Error> ensure_loaded(SessionSlot& slot, const SessionId& session_id);

    Error lock_timeout(const SessionId& session_id);
};

}  // namespace waypoint::state
