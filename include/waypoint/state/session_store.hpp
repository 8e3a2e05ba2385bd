#pragma once

#include "waypoint/core/result.hpp"
#include "waypoint/core/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace waypoint::state {

using namespace waypoint::core;

// Store keys
inline std::string state_key(const SessionId& id) { return "state_" + id; }
inline std::string messages_key(const SessionId& id) { return "messages_" + id; }

// Keyed persistence for serialized session documents.
// Implementations must be safe to call from several threads at once.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // Absent key is ok(nullopt); a failed read is an error
    virtual Result<std::optional<std::string>, Error> get(const std::string& key) = 0;

    virtual Result<void, Error> set(const std::string& key, const std::string& value) = 0;

    // Removing an absent key succeeds
    virtual Result<void, Error> remove(const std::string& key) = 0;
};

// Process-local store, used by tests and short-lived runs
class InMemorySessionStore : public SessionStore {
public:
    Result<std::optional<std::string>, Error> get(const std::string& key) override;
    Result<void, Error> set(const std::string& key, const std::string& value) override;
    Result<void, Error> remove(const std::string& key) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;
};

// One file per key under a directory. Writes go to a temporary file that is
// renamed over the target, so a reader never sees a half-written document.
class FileSessionStore : public SessionStore {
public:
    explicit FileSessionStore(const fs::path& directory);

    Result<std::optional<std::string>, Error> get(const std::string& key) override;
    Result<void, Error> set(const std::string& key, const std::string& value) override;
    Result<void, Error> remove(const std::string& key) override;

    const fs::path& directory() const { return directory_; }

private:
    fs::path directory_;

    fs::path key_path(const std::string& key) const;
};

}  // namespace waypoint::state
