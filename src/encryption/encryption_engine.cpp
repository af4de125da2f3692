#include "qkmail/encryption/encryption_engine.hpp"
#include "qkmail/crypto/aead_cipher.hpp"
#include "qkmail/crypto/digest.hpp"
#include "qkmail/crypto/rsa_key_pair.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/format.hpp"
#include "qkmail/debug/event_logger.hpp"
#include <algorithm>
#include <type_traits>
namespace qkmail::encryption {
using crypto::AeadAlgorithm;
using crypto::AeadCipher;
using crypto::Digest;
using crypto::SodiumInterop;
using debug::Role;
namespace {
    using Bytes = std::vector<uint8_t>;

    /// Wipes a scratch key buffer when the enclosing scope exits
    class ScopedWipe {
    public:
        explicit ScopedWipe(Bytes& buffer) noexcept : buffer_(buffer) {}
        ~ScopedWipe() { SodiumInterop::Wipe(buffer_); }
        ScopedWipe(const ScopedWipe&) = delete;
        ScopedWipe& operator=(const ScopedWipe&) = delete;
    private:
        Bytes& buffer_;
    };

    Bytes Xor(std::span<const uint8_t> data, std::span<const uint8_t> key) {
        Bytes out(data.size());
        for (size_t i = 0; i < data.size(); ++i) {
            out[i] = static_cast<uint8_t>(data[i] ^ key[i]);
        }
        return out;
    }

    Result<Bytes, QkdFailure> DeriveStandardKey(std::span<const uint8_t> quantum_key) {
        return Digest::HashExpand(quantum_key, Constants::AES_KEY_SIZE);
    }

    Result<Bytes, QkdFailure> DeriveHighKey(std::span<const uint8_t> quantum_key, const bool key_mixing) {
        if (!key_mixing) {
            return Digest::HashExpand(quantum_key, Constants::CHACHA20_KEY_SIZE);
        }
        auto mixed = Digest::Sha256(quantum_key);
        if (mixed.IsErr()) {
            return mixed;
        }
        ScopedWipe wipe_mixed(mixed.Unwrap());
        return Digest::HashExpand(mixed.Unwrap(), Constants::CHACHA20_KEY_SIZE);
    }

    /// SHA256(ephemeral[0..m) XOR quantum_key[0..m)), m = min of both lengths
    Result<Bytes, QkdFailure> MixKeys(std::span<const uint8_t> ephemeral, std::span<const uint8_t> quantum_key) {
        const size_t mixed_length = std::min(ephemeral.size(), quantum_key.size());
        Bytes mixed = Xor(ephemeral.first(mixed_length), quantum_key.first(mixed_length));
        ScopedWipe wipe_mixed(mixed);
        return Digest::Sha256(mixed);
    }

    Result<Bytes, QkdFailure> RequireNonce(const Bytes& nonce) {
        if (nonce.size() != Constants::AEAD_NONCE_SIZE) {
            return Result<Bytes, QkdFailure>::Err(
                QkdFailure::Decode(compat::format("Metadata nonce must be {} bytes, got {}",
                    Constants::AEAD_NONCE_SIZE, nonce.size())));
        }
        return Result<Bytes, QkdFailure>::Ok(nonce);
    }

    Result<EncryptionResult, QkdFailure> EncryptBasic(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> quantum_key) {
        if (quantum_key.size() < plaintext.size()) {
            return Result<EncryptionResult, QkdFailure>::Err(
                QkdFailure::KeyPolicy(compat::format("One-time pad key too short: {} bytes for a {} byte message",
                    quantum_key.size(), plaintext.size())));
        }
        return Result<EncryptionResult, QkdFailure>::Ok(EncryptionResult{
            Xor(plaintext, quantum_key),
            BasicMetadata{static_cast<uint32_t>(quantum_key.size())}});
    }

    Result<EncryptionResult, QkdFailure> EncryptAead(
        std::span<const uint8_t> plaintext,
        Bytes cipher_key,
        const AeadAlgorithm algorithm,
        CipherMetadata metadata,
        const Bytes& nonce) {
        ScopedWipe wipe_key(cipher_key);
        auto ciphertext = AeadCipher::Encrypt(algorithm, cipher_key, nonce, plaintext);
        if (ciphertext.IsErr()) {
            return Result<EncryptionResult, QkdFailure>::Err(std::move(ciphertext).UnwrapErr());
        }
        return Result<EncryptionResult, QkdFailure>::Ok(
            EncryptionResult{std::move(ciphertext).Unwrap(), std::move(metadata)});
    }

    Result<EncryptionResult, QkdFailure> EncryptStandard(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> quantum_key) {
        auto cipher_key = DeriveStandardKey(quantum_key);
        if (cipher_key.IsErr()) {
            return Result<EncryptionResult, QkdFailure>::Err(std::move(cipher_key).UnwrapErr());
        }
        Bytes nonce = SodiumInterop::GetRandomBytes(Constants::AEAD_NONCE_SIZE);
        return EncryptAead(plaintext, std::move(cipher_key).Unwrap(), AeadAlgorithm::Aes256Gcm,
            StandardMetadata{nonce}, nonce);
    }

    Result<EncryptionResult, QkdFailure> EncryptHigh(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> quantum_key) {
        auto cipher_key = DeriveHighKey(quantum_key, true);
        if (cipher_key.IsErr()) {
            return Result<EncryptionResult, QkdFailure>::Err(std::move(cipher_key).UnwrapErr());
        }
        Bytes nonce = SodiumInterop::GetRandomBytes(Constants::AEAD_NONCE_SIZE);
        return EncryptAead(plaintext, std::move(cipher_key).Unwrap(), AeadAlgorithm::ChaCha20Poly1305,
            HighMetadata{nonce, true}, nonce);
    }

    Result<EncryptionResult, QkdFailure> EncryptMaximum(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> quantum_key,
        const configuration::MaximumLevelOptions& options) {
        MaximumMetadata metadata;
        Bytes ephemeral;
        if (options.recipient_public_key != nullptr) {
            ephemeral = SodiumInterop::GetRandomBytes(Constants::EPHEMERAL_KEY_SIZE);
            auto wrapped = options.recipient_public_key->Wrap(ephemeral);
            if (wrapped.IsErr()) {
                SodiumInterop::Wipe(ephemeral);
                return Result<EncryptionResult, QkdFailure>::Err(std::move(wrapped).UnwrapErr());
            }
            metadata.ephemeral_mode = EphemeralMode::RsaWrapped;
            metadata.encrypted_key = std::move(wrapped).Unwrap();
        } else if (options.allow_quantum_derived_ephemeral) {
            auto derived = Digest::HashExpand(quantum_key, Constants::EPHEMERAL_KEY_SIZE);
            if (derived.IsErr()) {
                return Result<EncryptionResult, QkdFailure>::Err(std::move(derived).UnwrapErr());
            }
            ephemeral = std::move(derived).Unwrap();
            metadata.ephemeral_mode = EphemeralMode::QuantumDerived;
            QKM_LOG_EVENT(Role::Local, "encrypt", "maximum level using quantum-derived ephemeral key");
        } else {
            return Result<EncryptionResult, QkdFailure>::Err(
                QkdFailure::KeyPolicy("Maximum level needs a recipient public key or an explicit "
                    "opt-in to a quantum-derived ephemeral key"));
        }
        ScopedWipe wipe_ephemeral(ephemeral);

        auto cipher_key = MixKeys(ephemeral, quantum_key);
        if (cipher_key.IsErr()) {
            return Result<EncryptionResult, QkdFailure>::Err(std::move(cipher_key).UnwrapErr());
        }
        metadata.nonce = SodiumInterop::GetRandomBytes(Constants::AEAD_NONCE_SIZE);
        metadata.quantum_enhanced = true;
        const Bytes nonce = metadata.nonce;
        return EncryptAead(plaintext, std::move(cipher_key).Unwrap(), AeadAlgorithm::Aes256Gcm,
            std::move(metadata), nonce);
    }

    Result<Bytes, QkdFailure> DecryptAead(
        std::span<const uint8_t> ciphertext,
        Bytes cipher_key,
        const AeadAlgorithm algorithm,
        const Bytes& nonce) {
        ScopedWipe wipe_key(cipher_key);
        auto checked_nonce = RequireNonce(nonce);
        if (checked_nonce.IsErr()) {
            return checked_nonce;
        }
        return AeadCipher::Decrypt(algorithm, cipher_key, checked_nonce.Unwrap(), ciphertext);
    }

    class Decryptor {
    public:
        Decryptor(
            std::span<const uint8_t> ciphertext,
            std::span<const uint8_t> quantum_key,
            const crypto::RsaKeyPair* private_key)
            : ciphertext_(ciphertext), quantum_key_(quantum_key), private_key_(private_key) {}

        Result<Bytes, QkdFailure> operator()(const BasicMetadata&) const {
            if (quantum_key_.size() < ciphertext_.size()) {
                return Result<Bytes, QkdFailure>::Err(
                    QkdFailure::KeyPolicy("One-time pad key shorter than the ciphertext"));
            }
            return Result<Bytes, QkdFailure>::Ok(Xor(ciphertext_, quantum_key_));
        }

        Result<Bytes, QkdFailure> operator()(const StandardMetadata& metadata) const {
            auto cipher_key = DeriveStandardKey(quantum_key_);
            if (cipher_key.IsErr()) {
                return cipher_key;
            }
            return DecryptAead(ciphertext_, std::move(cipher_key).Unwrap(), AeadAlgorithm::Aes256Gcm, metadata.nonce);
        }

        Result<Bytes, QkdFailure> operator()(const HighMetadata& metadata) const {
            auto cipher_key = DeriveHighKey(quantum_key_, metadata.key_mixing);
            if (cipher_key.IsErr()) {
                return cipher_key;
            }
            return DecryptAead(ciphertext_, std::move(cipher_key).Unwrap(), AeadAlgorithm::ChaCha20Poly1305,
                metadata.nonce);
        }

        Result<Bytes, QkdFailure> operator()(const MaximumMetadata& metadata) const {
            Result<Bytes, QkdFailure> ephemeral = RecoverEphemeral(metadata);
            if (ephemeral.IsErr()) {
                return ephemeral;
            }
            ScopedWipe wipe_ephemeral(ephemeral.Unwrap());
            auto cipher_key = MixKeys(ephemeral.Unwrap(), quantum_key_);
            if (cipher_key.IsErr()) {
                return cipher_key;
            }
            return DecryptAead(ciphertext_, std::move(cipher_key).Unwrap(), AeadAlgorithm::Aes256Gcm, metadata.nonce);
        }

    private:
        Result<Bytes, QkdFailure> RecoverEphemeral(const MaximumMetadata& metadata) const {
            switch (metadata.ephemeral_mode) {
                case EphemeralMode::RsaWrapped:
                    if (metadata.encrypted_key.empty()) {
                        return Result<Bytes, QkdFailure>::Err(
                            QkdFailure::Decode("RSA-wrapped package carries no encrypted key"));
                    }
                    if (private_key_ == nullptr || !private_key_->HasPrivateKey()) {
                        return Result<Bytes, QkdFailure>::Err(
                            QkdFailure::KeyPolicy("RSA-wrapped package requires the recipient private key"));
                    }
                    return private_key_->Unwrap(metadata.encrypted_key);
                case EphemeralMode::QuantumDerived:
                    return Digest::HashExpand(quantum_key_, Constants::EPHEMERAL_KEY_SIZE);
            }
            return Result<Bytes, QkdFailure>::Err(QkdFailure::Decode("Unknown ephemeral key mode"));
        }

        std::span<const uint8_t> ciphertext_;
        std::span<const uint8_t> quantum_key_;
        const crypto::RsaKeyPair* private_key_;
    };
}
std::string_view AlgorithmOf(const CipherMetadata& metadata) noexcept {
    return std::visit([](const auto& alternative) -> std::string_view {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, BasicMetadata>) {
            return PackageConstants::ALGORITHM_OTP;
        } else if constexpr (std::is_same_v<T, StandardMetadata>) {
            return PackageConstants::ALGORITHM_AES_GCM;
        } else if constexpr (std::is_same_v<T, HighMetadata>) {
            return PackageConstants::ALGORITHM_CHACHA20;
        } else {
            return PackageConstants::ALGORITHM_HYBRID;
        }
    }, metadata);
}
Result<EncryptionResult, QkdFailure> EncryptionEngine::Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> quantum_key,
    const SecurityLevel level,
    const configuration::MaximumLevelOptions& options) {
    if (quantum_key.empty()) {
        return Result<EncryptionResult, QkdFailure>::Err(QkdFailure::InvalidInput("Quantum key is empty"));
    }
    QKM_LOG_EVENT(Role::Local, "encrypt", std::string("level ") + std::string(SecurityLevelName(level)));
    switch (level) {
        case SecurityLevel::Basic: return EncryptBasic(plaintext, quantum_key);
        case SecurityLevel::Standard: return EncryptStandard(plaintext, quantum_key);
        case SecurityLevel::High: return EncryptHigh(plaintext, quantum_key);
        case SecurityLevel::Maximum: return EncryptMaximum(plaintext, quantum_key, options);
    }
    return Result<EncryptionResult, QkdFailure>::Err(
        QkdFailure::InvalidInput(compat::format("Unknown security level {}", static_cast<int>(level))));
}
Result<std::vector<uint8_t>, QkdFailure> EncryptionEngine::Decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> quantum_key,
    const CipherMetadata& metadata,
    const crypto::RsaKeyPair* recipient_private_key) {
    if (quantum_key.empty()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(QkdFailure::InvalidInput("Quantum key is empty"));
    }
    QKM_LOG_EVENT(Role::Local, "decrypt", std::string("level ") + std::string(SecurityLevelName(LevelOf(metadata))));
    return std::visit(Decryptor(ciphertext, quantum_key, recipient_private_key), metadata);
}
}
