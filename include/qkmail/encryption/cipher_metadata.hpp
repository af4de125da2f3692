#pragma once

#include "qkmail/core/constants.hpp"
#include "qkmail/encryption/security_level.hpp"

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace qkmail::encryption {

/// One-time pad; no nonce, the key is used as-is
struct BasicMetadata {
    uint32_t key_length = 0;
};

/// AES-256-GCM under HashExpand(qkey)
struct StandardMetadata {
    std::vector<uint8_t> nonce;
};

/// ChaCha20-Poly1305 under HashExpand(SHA256(qkey)) when key_mixing is set
struct HighMetadata {
    std::vector<uint8_t> nonce;
    bool key_mixing = true;
};

enum class EphemeralMode : uint8_t {
    RsaWrapped,
    QuantumDerived
};

/// AES-256-GCM under SHA256(ephemeral XOR qkey)
struct MaximumMetadata {
    std::vector<uint8_t> nonce;
    EphemeralMode ephemeral_mode = EphemeralMode::RsaWrapped;
    /// RSA-OAEP wrapped ephemeral key; empty in QuantumDerived mode
    std::vector<uint8_t> encrypted_key;
    bool quantum_enhanced = true;
};

using CipherMetadata = std::variant<BasicMetadata, StandardMetadata, HighMetadata, MaximumMetadata>;

[[nodiscard]] inline SecurityLevel LevelOf(const CipherMetadata& metadata) noexcept {
    return static_cast<SecurityLevel>(metadata.index() + 1);
}

[[nodiscard]] std::string_view AlgorithmOf(const CipherMetadata& metadata) noexcept;

[[nodiscard]] constexpr std::string_view EphemeralModeName(const EphemeralMode mode) noexcept {
    return mode == EphemeralMode::RsaWrapped
        ? PackageConstants::EPHEMERAL_RSA_WRAPPED
        : PackageConstants::EPHEMERAL_QUANTUM_DERIVED;
}

} // namespace qkmail::encryption
