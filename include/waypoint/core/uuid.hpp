#pragma once

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace waypoint::core {

// UUID v4 implementation
class UUID {
public:
    UUID() : bytes_{} {}

    // Generate a new random UUID (v4)
    static UUID generate() {
        UUID uuid;

        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        // Set version (4) and variant (RFC 4122)
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        for (int i = 0; i < 8; ++i) {
            uuid.bytes_[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
            uuid.bytes_[i + 8] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
        }

        return uuid;
    }

    // Parse from string (format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx).
    // Anything else yields the null UUID.
    static UUID from_string(const std::string& str) {
        UUID uuid;

        if (str.length() != 36) {
            return uuid;
        }

        size_t byte_idx = 0;
        for (size_t i = 0; i < str.length() && byte_idx < 16; ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (str[i] != '-') {
                    return UUID{};
                }
                continue;
            }
            if (i + 1 >= str.length() || !is_hex(str[i]) || !is_hex(str[i + 1])) {
                return UUID{};
            }
            char hex[3] = {str[i], str[i + 1], '\0'};
            uuid.bytes_[byte_idx++] = static_cast<uint8_t>(std::strtoul(hex, nullptr, 16));
            ++i;
        }

        return uuid;
    }

    std::string to_string() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }

        return ss.str();
    }

    // Check if UUID is valid (non-zero)
    bool is_valid() const {
        for (auto b : bytes_) {
            if (b != 0) return true;
        }
        return false;
    }

    bool operator==(const UUID& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const UUID& other) const { return bytes_ != other.bytes_; }

private:
    std::array<uint8_t, 16> bytes_;

    static bool is_hex(char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }
};

inline std::string generate_session_id() {
    return "sess_" + UUID::generate().to_string().substr(0, 8);
}

inline std::string generate_task_id() {
    return "task_" + UUID::generate().to_string().substr(0, 13);
}

}  // namespace waypoint::core
