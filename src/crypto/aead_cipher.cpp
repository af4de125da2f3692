#include "qkmail/crypto/aead_cipher.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/constants.hpp"
#include "qkmail/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>
namespace qkmail::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    const EVP_CIPHER* SelectCipher(const AeadAlgorithm algorithm) {
        switch (algorithm) {
            case AeadAlgorithm::Aes256Gcm: return EVP_aes_256_gcm();
            case AeadAlgorithm::ChaCha20Poly1305: return EVP_chacha20_poly1305();
        }
        return nullptr;
    }
    const char* AlgorithmName(const AeadAlgorithm algorithm) {
        return algorithm == AeadAlgorithm::Aes256Gcm ? "AES-256-GCM" : "ChaCha20-Poly1305";
    }
    Result<Unit, QkdFailure> ValidateKeyAndNonce(
        const AeadAlgorithm algorithm,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, QkdFailure>::Err(
                QkdFailure::InvalidInput(
                    compat::format("{} key must be {} bytes, got {}",
                        AlgorithmName(algorithm), Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AEAD_NONCE_SIZE) {
            return Result<Unit, QkdFailure>::Err(
                QkdFailure::InvalidInput(
                    compat::format("{} nonce must be {} bytes, got {}",
                        AlgorithmName(algorithm), Constants::AEAD_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, QkdFailure>::Ok(unit);
    }
    // Both ciphers accept the GCM-style ctrl codes through the generic AEAD aliases.
    Result<EVP_CIPHER_CTX_ptr, QkdFailure> InitContext(
        const AeadAlgorithm algorithm,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        const int encrypt) {
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<EVP_CIPHER_CTX_ptr, QkdFailure>::Err(
                QkdFailure::Generic("Failed to create cipher context: " + GetOpenSSLError()));
        }
        if (EVP_CipherInit_ex(ctx.get(), SelectCipher(algorithm), nullptr, nullptr, nullptr, encrypt) != OpenSSL::SUCCESS) {
            return Result<EVP_CIPHER_CTX_ptr, QkdFailure>::Err(
                QkdFailure::Generic(std::string("Failed to initialize ") + AlgorithmName(algorithm) +
                    ": " + GetOpenSSLError()));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                               static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
            return Result<EVP_CIPHER_CTX_ptr, QkdFailure>::Err(
                QkdFailure::Generic("Failed to set nonce length: " + GetOpenSSLError()));
        }
        if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), encrypt) != OpenSSL::SUCCESS) {
            return Result<EVP_CIPHER_CTX_ptr, QkdFailure>::Err(
                QkdFailure::Generic("Failed to set key and nonce: " + GetOpenSSLError()));
        }
        return Result<EVP_CIPHER_CTX_ptr, QkdFailure>::Ok(std::move(ctx));
    }
}
Result<std::vector<uint8_t>, QkdFailure>
AeadCipher::Encrypt(
    const AeadAlgorithm algorithm,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(algorithm, key, nonce); valid.IsErr()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(std::move(valid).UnwrapErr());
    }
    auto ctx_result = InitContext(algorithm, key, nonce, 1);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx = std::move(ctx_result).Unwrap();
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, QkdFailure>::Err(
                QkdFailure::Generic("Failed to add associated data: " + GetOpenSSLError()));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AEAD_TAG_SIZE);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::Wipe(output);
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("Encryption failed: " + GetOpenSSLError()));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::Wipe(output);
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("Encryption finalization failed: " + GetOpenSSLError()));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                           static_cast<int>(Constants::AEAD_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        SodiumInterop::Wipe(output);
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("Failed to get authentication tag: " + GetOpenSSLError()));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AEAD_TAG_SIZE);
    return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, QkdFailure>
AeadCipher::Decrypt(
    const AeadAlgorithm algorithm,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(algorithm, key, nonce); valid.IsErr()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < Constants::AEAD_TAG_SIZE) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Decode(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AEAD_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AEAD_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    auto ctx_result = InitContext(algorithm, key, nonce, 0);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx = std::move(ctx_result).Unwrap();
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, QkdFailure>::Err(
                QkdFailure::Generic("Failed to add associated data: " + GetOpenSSLError()));
        }
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::Wipe(output);
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("Decryption failed: " + GetOpenSSLError()));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                           static_cast<int>(Constants::AEAD_TAG_SIZE),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        SodiumInterop::Wipe(output);
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::Generic("Failed to set authentication tag: " + GetOpenSSLError()));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::Wipe(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::CryptoIntegrity(
                std::string(AlgorithmName(algorithm)) +
                " authentication tag verification failed - data may have been tampered with"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(output));
}
}
