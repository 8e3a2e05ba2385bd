#include "waypoint/state/session_store.hpp"
#include "waypoint/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace waypoint::state {

// InMemorySessionStore
Result<std::optional<std::string>, Error> InMemorySessionStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>, Error>::ok(it->second);
}

Result<void, Error> InMemorySessionStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
    return Result<void, Error>::ok();
}

Result<void, Error> InMemorySessionStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key);
    return Result<void, Error>::ok();
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

// FileSessionStore
FileSessionStore::FileSessionStore(const fs::path& directory)
    : directory_(directory)
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::warn("Could not create session directory {}: {}", directory_.string(), ec.message());
    }
}

fs::path FileSessionStore::key_path(const std::string& key) const {
    return directory_ / (key + ".json");
}

namespace {

bool is_safe_key(const std::string& key) {
    if (key.empty() || key == "." || key == "..") {
        return false;
    }
    return key.find('/') == std::string::npos && key.find('\\') == std::string::npos;
}

}  // namespace

Result<std::optional<std::string>, Error> FileSessionStore::get(const std::string& key) {
    if (!is_safe_key(key)) {
        return Result<std::optional<std::string>, Error>::err(
            ErrorCode::InvalidArgument, "Invalid store key", key);
    }

    auto path = key_path(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Result<std::optional<std::string>, Error>::err(
                ErrorCode::StoreReadFailed, ec.message(), path.string());
        }
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }

    std::ifstream file(path);
    if (!file) {
        return Result<std::optional<std::string>, Error>::err(
            ErrorCode::StoreReadFailed, "Failed to open session file", path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result<std::optional<std::string>, Error>::err(
            ErrorCode::StoreReadFailed, "Failed to read session file", path.string());
    }
    return Result<std::optional<std::string>, Error>::ok(buffer.str());
}

Result<void, Error> FileSessionStore::set(const std::string& key, const std::string& value) {
    if (!is_safe_key(key)) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "Invalid store key", key);
    }

    auto path = key_path(key);
    auto tmp = directory_ / (key + ".json.tmp-" + UUID::generate().to_string().substr(0, 8));

    try {
        fs::create_directories(directory_);
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file) {
                return Result<void, Error>::err(
                    ErrorCode::FileWriteFailed, "Failed to open session file", tmp.string());
            }
            file << value;
            file.flush();
            if (!file) {
                std::error_code ignored;
                fs::remove(tmp, ignored);
                return Result<void, Error>::err(
                    ErrorCode::FileWriteFailed, "Failed to write session file", tmp.string());
            }
        }
        fs::rename(tmp, path);

    } catch (const fs::filesystem_error& e) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void, Error>::err(ErrorCode::FileWriteFailed, e.what(), path.string());
    }

    return Result<void, Error>::ok();
}

Result<void, Error> FileSessionStore::remove(const std::string& key) {
    if (!is_safe_key(key)) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "Invalid store key", key);
    }

    std::error_code ec;
    fs::remove(key_path(key), ec);
    if (ec) {
        return Result<void, Error>::err(ErrorCode::FileWriteFailed, ec.message(), key_path(key).string());
    }
    return Result<void, Error>::ok();
}

}  // namespace waypoint::state
