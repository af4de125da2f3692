#pragma once

#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qkmail::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Randomness, secure wiping and the hex/base64 codecs used by the key
 * exchange and the package envelope.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /// Clears key material with sodium_memzero, which the optimizer cannot elide
    static void Wipe(std::span<uint8_t> buffer) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform random value in [0, upper_bound)
     */
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Encoding
    // ========================================================================

    static std::string ToHex(std::span<const uint8_t> data);
    static Result<std::vector<uint8_t>, SodiumFailure> FromHex(std::string_view hex);

    /// Standard alphabet with padding, as used by ETSI GS QKD 014 key fields.
    static std::string ToBase64(std::span<const uint8_t> data);
    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view text);

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace qkmail::crypto
