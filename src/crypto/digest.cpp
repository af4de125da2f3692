#include "qkmail/crypto/digest.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/constants.hpp"
#include "qkmail/core/format.hpp"

#include <openssl/evp.h>
#include <string>

namespace qkmail::crypto {

Result<std::vector<uint8_t>, QkdFailure> Digest::Sha256(std::span<const uint8_t> data) {
    std::vector<uint8_t> digest(HASH_LEN);
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != OpenSSLConstants::SUCCESS ||
        digest_len != HASH_LEN) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("SHA-256 digest failed"));
    }

    return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(digest));
}

Result<std::vector<uint8_t>, QkdFailure> Digest::HashExpand(
    std::span<const uint8_t> ikm,
    const size_t output_size) {

    if (output_size == 0) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::InvalidInput("Hash expansion output size must be positive"));
    }
    if (output_size > Constants::MAX_BUFFER_SIZE) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::InvalidInput(
                compat::format("Hash expansion output size exceeds maximum allowed: {}", output_size)));
    }

    auto first = Sha256(ikm);
    if (first.IsErr()) {
        return first;
    }
    std::vector<uint8_t> derived = std::move(first).Unwrap();
    derived.reserve(output_size + HASH_LEN);

    // Each round hashes everything accumulated so far.
    while (derived.size() < output_size) {
        auto block = Sha256(derived);
        if (block.IsErr()) {
            SodiumInterop::Wipe(derived);
            return block;
        }
        auto next = std::move(block).Unwrap();
        derived.insert(derived.end(), next.begin(), next.end());
        SodiumInterop::Wipe(next);
    }

    if (derived.size() > output_size) {
        SodiumInterop::Wipe(std::span<uint8_t>(derived).subspan(output_size));
        derived.resize(output_size);
    }
    return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(derived));
}

} // namespace qkmail::crypto
