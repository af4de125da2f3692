#pragma once

#include "qkmail/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace qkmail::configuration {

/// Lifetime and usage limits applied to every key a KeyManager stores
///
/// - Interactive: 10 minutes, single use (one encrypt or one decrypt)
/// - Storage: 24 hours, two uses (sender encrypts, recipient decrypts)
/// - Unlimited: caller-chosen lifetime, no usage cap
class KeyPolicy {
public:
    [[nodiscard]] static constexpr KeyPolicy Interactive() noexcept {
        return KeyPolicy(
            std::chrono::duration_cast<std::chrono::seconds>(KeyPolicyConstants::INTERACTIVE_TTL),
            KeyPolicyConstants::INTERACTIVE_MAX_USAGE);
    }

    [[nodiscard]] static constexpr KeyPolicy Storage() noexcept {
        return KeyPolicy(
            std::chrono::duration_cast<std::chrono::seconds>(KeyPolicyConstants::STORAGE_TTL),
            KeyPolicyConstants::STORAGE_MAX_USAGE);
    }

    [[nodiscard]] static constexpr KeyPolicy Unlimited(const std::chrono::seconds ttl) noexcept {
        return KeyPolicy(ttl, std::nullopt);
    }

    [[nodiscard]] static constexpr KeyPolicy Custom(
        const std::chrono::seconds ttl,
        const std::optional<uint32_t> max_usage) noexcept {
        return KeyPolicy(ttl, max_usage);
    }

    [[nodiscard]] static constexpr KeyPolicy Default() noexcept {
        return Storage();
    }

    [[nodiscard]] constexpr std::chrono::seconds Ttl() const noexcept {
        return ttl_;
    }

    /// Empty means the key may be read any number of times until it expires
    [[nodiscard]] constexpr std::optional<uint32_t> MaxUsage() const noexcept {
        return max_usage_;
    }

private:
    constexpr KeyPolicy(const std::chrono::seconds ttl, const std::optional<uint32_t> max_usage) noexcept
        : ttl_(ttl), max_usage_(max_usage) {}

    std::chrono::seconds ttl_;
    std::optional<uint32_t> max_usage_;
};

} // namespace qkmail::configuration
