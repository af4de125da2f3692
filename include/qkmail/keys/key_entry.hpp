#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qkmail::keys {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

enum class KeyState : uint8_t {
    Active,
    Consumed,
    Expired
};

/// Master originated the key exchange; Slave retrieved a key by id.
enum class KeyRole : uint8_t {
    Master,
    Slave
};

struct KeyMetadata {
    std::string peer_id;
    KeyRole role = KeyRole::Master;
    std::string provenance;
    std::string purpose;
    uint32_t key_length_bits = 0;
};

struct KeyEntry {
    std::string key_id;
    std::vector<uint8_t> key_bytes;
    TimePoint created_at;
    TimePoint expires_at;
    uint32_t usage_count = 0;
    std::optional<uint32_t> max_usage;
    KeyState state = KeyState::Active;
    KeyMetadata metadata;

    [[nodiscard]] bool IsExpiredAt(const TimePoint now) const noexcept {
        return now >= expires_at;
    }

    [[nodiscard]] bool IsUsageExhausted() const noexcept {
        return max_usage.has_value() && usage_count >= *max_usage;
    }
};

/// Everything about a stored key except the key material
struct KeySummary {
    std::string key_id;
    TimePoint created_at;
    TimePoint expires_at;
    uint32_t usage_count = 0;
    std::optional<uint32_t> max_usage;
    KeyState state = KeyState::Active;
    KeyMetadata metadata;
};

[[nodiscard]] constexpr std::string_view KeyStateName(const KeyState state) noexcept {
    switch (state) {
        case KeyState::Active: return "active";
        case KeyState::Consumed: return "consumed";
        case KeyState::Expired: return "expired";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view KeyRoleName(const KeyRole role) noexcept {
    return role == KeyRole::Master ? "master" : "slave";
}

} // namespace qkmail::keys
