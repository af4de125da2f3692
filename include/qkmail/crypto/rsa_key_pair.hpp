#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/core/constants.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace qkmail::crypto {

struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* key) const {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;

/**
 * @brief RSA key used to wrap Maximum-level ephemeral keys.
 *
 * Wrapping is RSA-OAEP with SHA-256 for both the OAEP digest and MGF1.
 * A key imported from a public PEM can only Wrap.
 */
class RsaKeyPair {
public:
    [[nodiscard]] static Result<RsaKeyPair, QkdFailure> Generate(
        int bits = OpenSSLConstants::RSA_DEFAULT_BITS);
    [[nodiscard]] static Result<RsaKeyPair, QkdFailure> FromPrivateKeyPem(std::string_view pem);
    [[nodiscard]] static Result<RsaKeyPair, QkdFailure> FromPublicKeyPem(std::string_view pem);

    [[nodiscard]] bool HasPrivateKey() const noexcept { return has_private_; }

    /// PKCS#8 PEM.
    [[nodiscard]] Result<std::string, QkdFailure> PrivateKeyPem() const;
    /// SubjectPublicKeyInfo PEM.
    [[nodiscard]] Result<std::string, QkdFailure> PublicKeyPem() const;

    [[nodiscard]] Result<std::vector<uint8_t>, QkdFailure> Wrap(
        std::span<const uint8_t> plaintext) const;
    [[nodiscard]] Result<std::vector<uint8_t>, QkdFailure> Unwrap(
        std::span<const uint8_t> wrapped) const;

    RsaKeyPair(RsaKeyPair&&) noexcept = default;
    RsaKeyPair& operator=(RsaKeyPair&&) noexcept = default;
    RsaKeyPair(const RsaKeyPair&) = delete;
    RsaKeyPair& operator=(const RsaKeyPair&) = delete;
    ~RsaKeyPair() = default;

private:
    RsaKeyPair(EVP_PKEY_ptr key, bool has_private)
        : key_(std::move(key)), has_private_(has_private) {}

    EVP_PKEY_ptr key_;
    bool has_private_;
};
}
