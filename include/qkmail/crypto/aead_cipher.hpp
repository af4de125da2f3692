#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace qkmail::crypto {

enum class AeadAlgorithm {
    Aes256Gcm,
    ChaCha20Poly1305
};

/**
 * AEAD encryption over OpenSSL EVP (AES-256-GCM and ChaCha20-Poly1305).
 *
 * Both algorithms take a 32-byte key and a 96-bit nonce. Output of Encrypt
 * is ciphertext followed by the 16-byte tag; Decrypt expects the same layout.
 *
 * NONCE UNIQUENESS: this is a stateless primitive. Every caller in this
 * library draws a fresh random nonce per message, and every message key is
 * derived from a single-use quantum key, so a (key, nonce) pair never repeats.
 *
 * A tag mismatch on Decrypt is reported as CryptoIntegrity and no plaintext
 * is released.
 */
class AeadCipher {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, QkdFailure>
    Encrypt(
        AeadAlgorithm algorithm,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, QkdFailure>
    Decrypt(
        AeadAlgorithm algorithm,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AeadCipher() = delete;
};
}
