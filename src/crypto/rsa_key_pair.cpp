#include "qkmail/crypto/rsa_key_pair.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/format.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
namespace qkmail::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_PKEY_CTX_Deleter {
        void operator()(EVP_PKEY_CTX* ctx) const {
            if (ctx) {
                EVP_PKEY_CTX_free(ctx);
            }
        }
    };
    using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
    struct BIO_Deleter {
        void operator()(BIO* bio) const {
            if (bio) {
                BIO_free(bio);
            }
        }
    };
    using BIO_ptr = std::unique_ptr<BIO, BIO_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    std::string DrainBio(BIO* bio) {
        char* data = nullptr;
        const long len = BIO_get_mem_data(bio, &data);
        return len > 0 ? std::string(data, static_cast<size_t>(len)) : std::string();
    }
    Result<Unit, QkdFailure> ConfigureOaep(EVP_PKEY_CTX* ctx) {
        if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0) {
            return Result<Unit, QkdFailure>::Err(
                QkdFailure::Generic("Failed to configure RSA-OAEP-SHA256: " + GetOpenSSLError()));
        }
        return Result<Unit, QkdFailure>::Ok(unit);
    }
}
Result<RsaKeyPair, QkdFailure> RsaKeyPair::Generate(const int bits) {
    if (bits < OpenSSL::RSA_DEFAULT_BITS) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::InvalidInput(compat::format("RSA modulus must be at least {} bits, got {}",
                OpenSSL::RSA_DEFAULT_BITS, bits)));
    }
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::Generic("Failed to initialize RSA key generation: " + GetOpenSSLError()));
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::Generic("Failed to set RSA modulus size: " + GetOpenSSLError()));
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_generate(ctx.get(), &raw) <= 0) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::Generic("RSA key generation failed: " + GetOpenSSLError()));
    }
    return Result<RsaKeyPair, QkdFailure>::Ok(RsaKeyPair(EVP_PKEY_ptr(raw), true));
}
Result<RsaKeyPair, QkdFailure> RsaKeyPair::FromPrivateKeyPem(std::string_view pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::Generic("Failed to allocate BIO: " + GetOpenSSLError()));
    }
    EVP_PKEY_ptr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::Decode("Invalid RSA private key PEM: " + GetOpenSSLError()));
    }
    return Result<RsaKeyPair, QkdFailure>::Ok(RsaKeyPair(std::move(key), true));
}
Result<RsaKeyPair, QkdFailure> RsaKeyPair::FromPublicKeyPem(std::string_view pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::Generic("Failed to allocate BIO: " + GetOpenSSLError()));
    }
    EVP_PKEY_ptr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        return Result<RsaKeyPair, QkdFailure>::Err(
            QkdFailure::Decode("Invalid RSA public key PEM: " + GetOpenSSLError()));
    }
    return Result<RsaKeyPair, QkdFailure>::Ok(RsaKeyPair(std::move(key), false));
}
Result<std::string, QkdFailure> RsaKeyPair::PrivateKeyPem() const {
    if (!has_private_) {
        return Result<std::string, QkdFailure>::Err(
            QkdFailure::KeyPolicy("RSA key has no private component"));
    }
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<std::string, QkdFailure>::Err(
            QkdFailure::Encode("Failed to export RSA private key: " + GetOpenSSLError()));
    }
    return Result<std::string, QkdFailure>::Ok(DrainBio(bio.get()));
}
Result<std::string, QkdFailure> RsaKeyPair::PublicKeyPem() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != OpenSSL::SUCCESS) {
        return Result<std::string, QkdFailure>::Err(
            QkdFailure::Encode("Failed to export RSA public key: " + GetOpenSSLError()));
    }
    return Result<std::string, QkdFailure>::Ok(DrainBio(bio.get()));
}
Result<std::vector<uint8_t>, QkdFailure> RsaKeyPair::Wrap(std::span<const uint8_t> plaintext) const {
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key_.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("Failed to initialize RSA encryption: " + GetOpenSSLError()));
    }
    if (auto oaep = ConfigureOaep(ctx.get()); oaep.IsErr()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(std::move(oaep).UnwrapErr());
    }
    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, plaintext.data(), plaintext.size()) <= 0) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::InvalidInput(compat::format("RSA-OAEP cannot wrap {} bytes: {}",
                plaintext.size(), GetOpenSSLError())));
    }
    std::vector<uint8_t> wrapped(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), wrapped.data(), &out_len, plaintext.data(), plaintext.size()) <= 0) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("RSA-OAEP encryption failed: " + GetOpenSSLError()));
    }
    wrapped.resize(out_len);
    return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(wrapped));
}
Result<std::vector<uint8_t>, QkdFailure> RsaKeyPair::Unwrap(std::span<const uint8_t> wrapped) const {
    if (!has_private_) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::KeyPolicy("RSA key has no private component"));
    }
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key_.get(), nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("Failed to initialize RSA decryption: " + GetOpenSSLError()));
    }
    if (auto oaep = ConfigureOaep(ctx.get()); oaep.IsErr()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(std::move(oaep).UnwrapErr());
    }
    size_t out_len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, wrapped.data(), wrapped.size()) <= 0) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::CryptoIntegrity("RSA-OAEP unwrap failed: " + GetOpenSSLError()));
    }
    std::vector<uint8_t> plaintext(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &out_len, wrapped.data(), wrapped.size()) <= 0) {
        SodiumInterop::Wipe(plaintext);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::CryptoIntegrity("RSA-OAEP unwrap failed: wrapped key rejected"));
    }
    plaintext.resize(out_len);
    return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(plaintext));
}
}
