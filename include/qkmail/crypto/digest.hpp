#pragma once

#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace qkmail::crypto {

/**
 * @brief SHA-256 hashing and hash-chain key stretching
 *
 * Backed by OpenSSL's EVP digest API.
 */
class Digest {
public:
    /**
     * @brief One-shot SHA-256
     *
     * @return Ok(32-byte digest) or Err
     */
    static Result<std::vector<uint8_t>, QkdFailure> Sha256(std::span<const uint8_t> data);

    /**
     * @brief Stretch input material to an exact length with a SHA-256 chain
     *
     * D = SHA256(ikm); while |D| < n: D = D || SHA256(D); return D[0..n).
     *
     * Used both for privacy amplification of sifted BB84 bits and for deriving
     * fixed-size cipher keys from quantum keys of arbitrary length. The output
     * is deterministic in (ikm, n).
     *
     * @param ikm Input key material (may be empty)
     * @param output_size Desired output size in bytes (> 0)
     * @return Ok(derived bytes) or Err
     */
    static Result<std::vector<uint8_t>, QkdFailure> HashExpand(
        std::span<const uint8_t> ikm,
        size_t output_size);

    static constexpr size_t HASH_LEN = 32;

private:
    Digest() = delete;
};

} // namespace qkmail::crypto
