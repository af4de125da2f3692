#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/configuration/maximum_level_options.hpp"
#include "qkmail/encryption/cipher_metadata.hpp"
#include "qkmail/encryption/security_level.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace qkmail::crypto {
class RsaKeyPair;
}
namespace qkmail::encryption {

struct EncryptionResult {
    std::vector<uint8_t> ciphertext;
    CipherMetadata metadata;
};

/**
 * @brief Four-level message cipher keyed by a shared quantum key
 *
 * Encrypt picks the construction from @p level; Decrypt picks it from the
 * metadata alone. Derived cipher keys live only for the duration of a call
 * and are wiped before returning.
 *
 * - Basic: one-time pad, key must cover the whole message
 * - Standard: AES-256-GCM, key = HashExpand(qkey, 32)
 * - High: ChaCha20-Poly1305, key = HashExpand(SHA256(qkey), 32)
 * - Maximum: AES-256-GCM, key = SHA256(ephemeral XOR qkey), ephemeral key
 *   RSA-OAEP wrapped for the recipient or, on request, derived from qkey
 */
class EncryptionEngine {
public:
    [[nodiscard]] static Result<EncryptionResult, QkdFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> quantum_key,
        SecurityLevel level,
        const configuration::MaximumLevelOptions& options = {});

    /// @param recipient_private_key required only for RSA-wrapped Maximum packages
    [[nodiscard]] static Result<std::vector<uint8_t>, QkdFailure> Decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> quantum_key,
        const CipherMetadata& metadata,
        const crypto::RsaKeyPair* recipient_private_key = nullptr);

private:
    EncryptionEngine() = delete;
};

} // namespace qkmail::encryption
