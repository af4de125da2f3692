#include "qkmail/encryption/package_codec.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/format.hpp"
#include "envelope/encrypted_package.pb.h"
#include <type_traits>

namespace qkmail::encryption {
    using crypto::SodiumInterop;

    namespace {
        proto::envelope::SecurityLevel ToProtoLevel(const SecurityLevel level) {
            switch (level) {
                case SecurityLevel::Basic: return proto::envelope::SECURITY_LEVEL_BASIC;
                case SecurityLevel::Standard: return proto::envelope::SECURITY_LEVEL_STANDARD;
                case SecurityLevel::High: return proto::envelope::SECURITY_LEVEL_HIGH;
                case SecurityLevel::Maximum: return proto::envelope::SECURITY_LEVEL_MAXIMUM;
            }
            return proto::envelope::SECURITY_LEVEL_UNSPECIFIED;
        }

        Result<std::vector<uint8_t>, QkdFailure> DecodeNonce(const std::string& hex) {
            if (hex.empty()) {
                return Result<std::vector<uint8_t>, QkdFailure>::Err(
                    QkdFailure::Decode("Metadata is missing the nonce"));
            }
            auto nonce = SodiumInterop::FromHex(hex);
            if (nonce.IsErr()) {
                return Result<std::vector<uint8_t>, QkdFailure>::Err(
                    QkdFailure::Decode("Metadata nonce is not valid hex"));
            }
            if (nonce.Unwrap().size() != Constants::AEAD_NONCE_SIZE) {
                return Result<std::vector<uint8_t>, QkdFailure>::Err(
                    QkdFailure::Decode(compat::format("Metadata nonce must be {} bytes", Constants::AEAD_NONCE_SIZE)));
            }
            return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(nonce).Unwrap());
        }

        Result<Unit, QkdFailure> ExpectAlgorithm(const proto::envelope::CipherMetadata& message,
                                                 const std::string_view expected) {
            if (message.algorithm() != expected) {
                return Result<Unit, QkdFailure>::Err(
                    QkdFailure::Decode(compat::format("Algorithm '{}' does not match level {}",
                        message.algorithm(), static_cast<int>(message.security_level()))));
            }
            return Result<Unit, QkdFailure>::Ok(unit);
        }

        Result<CipherMetadata, QkdFailure> ParseMaximum(const proto::envelope::CipherMetadata& message) {
            auto nonce = DecodeNonce(message.nonce());
            if (nonce.IsErr()) {
                return Result<CipherMetadata, QkdFailure>::Err(std::move(nonce).UnwrapErr());
            }
            MaximumMetadata metadata;
            metadata.nonce = std::move(nonce).Unwrap();
            metadata.quantum_enhanced = message.quantum_enhanced();
            if (message.ephemeral_mode() == PackageConstants::EPHEMERAL_RSA_WRAPPED) {
                auto wrapped = SodiumInterop::FromHex(message.encrypted_key());
                if (wrapped.IsErr() || wrapped.Unwrap().empty()) {
                    return Result<CipherMetadata, QkdFailure>::Err(
                        QkdFailure::Decode("RSA-wrapped metadata needs a hex encrypted_key"));
                }
                metadata.ephemeral_mode = EphemeralMode::RsaWrapped;
                metadata.encrypted_key = std::move(wrapped).Unwrap();
            } else if (message.ephemeral_mode() == PackageConstants::EPHEMERAL_QUANTUM_DERIVED) {
                if (!message.encrypted_key().empty()) {
                    return Result<CipherMetadata, QkdFailure>::Err(
                        QkdFailure::Decode("Quantum-derived metadata must not carry an encrypted_key"));
                }
                metadata.ephemeral_mode = EphemeralMode::QuantumDerived;
            } else {
                return Result<CipherMetadata, QkdFailure>::Err(
                    QkdFailure::Decode("Unknown ephemeral mode '" + message.ephemeral_mode() + "'"));
            }
            return Result<CipherMetadata, QkdFailure>::Ok(CipherMetadata{std::move(metadata)});
        }
    }

    proto::envelope::CipherMetadata MetadataCodec::ToProto(const CipherMetadata& metadata) {
        proto::envelope::CipherMetadata message;
        message.set_security_level(ToProtoLevel(LevelOf(metadata)));
        message.set_algorithm(std::string(AlgorithmOf(metadata)));
        std::visit([&message](const auto& alternative) {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, BasicMetadata>) {
                message.set_key_length(alternative.key_length);
            } else if constexpr (std::is_same_v<T, StandardMetadata>) {
                message.set_nonce(SodiumInterop::ToHex(alternative.nonce));
            } else if constexpr (std::is_same_v<T, HighMetadata>) {
                message.set_nonce(SodiumInterop::ToHex(alternative.nonce));
                message.set_key_mixing(alternative.key_mixing);
            } else {
                message.set_nonce(SodiumInterop::ToHex(alternative.nonce));
                message.set_ephemeral_mode(std::string(EphemeralModeName(alternative.ephemeral_mode)));
                if (!alternative.encrypted_key.empty()) {
                    message.set_encrypted_key(SodiumInterop::ToHex(alternative.encrypted_key));
                }
                message.set_quantum_enhanced(alternative.quantum_enhanced);
            }
        }, metadata);
        return message;
    }

    Result<CipherMetadata, QkdFailure> MetadataCodec::FromProto(const proto::envelope::CipherMetadata& message) {
        switch (message.security_level()) {
            case proto::envelope::SECURITY_LEVEL_BASIC: {
                if (auto check = ExpectAlgorithm(message, PackageConstants::ALGORITHM_OTP); check.IsErr()) {
                    return Result<CipherMetadata, QkdFailure>::Err(std::move(check).UnwrapErr());
                }
                if (message.key_length() == 0) {
                    return Result<CipherMetadata, QkdFailure>::Err(
                        QkdFailure::Decode("One-time pad metadata is missing key_length"));
                }
                return Result<CipherMetadata, QkdFailure>::Ok(BasicMetadata{message.key_length()});
            }
            case proto::envelope::SECURITY_LEVEL_STANDARD: {
                if (auto check = ExpectAlgorithm(message, PackageConstants::ALGORITHM_AES_GCM); check.IsErr()) {
                    return Result<CipherMetadata, QkdFailure>::Err(std::move(check).UnwrapErr());
                }
                auto nonce = DecodeNonce(message.nonce());
                if (nonce.IsErr()) {
                    return Result<CipherMetadata, QkdFailure>::Err(std::move(nonce).UnwrapErr());
                }
                return Result<CipherMetadata, QkdFailure>::Ok(StandardMetadata{std::move(nonce).Unwrap()});
            }
            case proto::envelope::SECURITY_LEVEL_HIGH: {
                if (auto check = ExpectAlgorithm(message, PackageConstants::ALGORITHM_CHACHA20); check.IsErr()) {
                    return Result<CipherMetadata, QkdFailure>::Err(std::move(check).UnwrapErr());
                }
                auto nonce = DecodeNonce(message.nonce());
                if (nonce.IsErr()) {
                    return Result<CipherMetadata, QkdFailure>::Err(std::move(nonce).UnwrapErr());
                }
                return Result<CipherMetadata, QkdFailure>::Ok(
                    HighMetadata{std::move(nonce).Unwrap(), message.key_mixing()});
            }
            case proto::envelope::SECURITY_LEVEL_MAXIMUM: {
                if (auto check = ExpectAlgorithm(message, PackageConstants::ALGORITHM_HYBRID); check.IsErr()) {
                    return Result<CipherMetadata, QkdFailure>::Err(std::move(check).UnwrapErr());
                }
                return ParseMaximum(message);
            }
            default:
                return Result<CipherMetadata, QkdFailure>::Err(
                    QkdFailure::Decode(compat::format("Invalid security level in metadata: {}",
                        static_cast<int>(message.security_level()))));
        }
    }

    EncryptedPackage PackageCodec::BuildPackage(
        std::vector<uint8_t> ciphertext,
        std::string key_id,
        CipherMetadata metadata,
        std::string sender_id) {
        return EncryptedPackage{
            std::move(ciphertext),
            std::move(key_id),
            std::move(metadata),
            std::move(sender_id),
            std::string(PackageConstants::PROTOCOL),
            std::string(PackageConstants::VERSION)};
    }

    Result<std::vector<uint8_t>, QkdFailure> PackageCodec::Serialize(const EncryptedPackage& package) {
        try {
            proto::envelope::EncryptedPackage message;
            message.set_ciphertext(package.ciphertext.data(), package.ciphertext.size());
            message.set_key_id(package.key_id);
            *message.mutable_metadata() = MetadataCodec::ToProto(package.metadata);
            message.set_sender_id(package.sender_id);
            message.set_protocol(package.protocol);
            message.set_version(package.version);

            std::vector<uint8_t> bytes(message.ByteSizeLong());
            if (!message.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
                return Result<std::vector<uint8_t>, QkdFailure>::Err(
                    QkdFailure::Encode("Failed to serialize EncryptedPackage to protobuf"));
            }
            return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(bytes));
        } catch (const std::exception& ex) {
            return Result<std::vector<uint8_t>, QkdFailure>::Err(
                QkdFailure::Encode(std::string("Exception while serializing EncryptedPackage: ") + ex.what()));
        }
    }

    Result<EncryptedPackage, QkdFailure> PackageCodec::Parse(std::span<const uint8_t> bytes) {
        proto::envelope::EncryptedPackage message;
        if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<EncryptedPackage, QkdFailure>::Err(
                QkdFailure::Decode("Failed to parse EncryptedPackage from protobuf"));
        }
        if (message.protocol() != PackageConstants::PROTOCOL) {
            return Result<EncryptedPackage, QkdFailure>::Err(
                QkdFailure::Decode("Unsupported package protocol '" + message.protocol() + "'"));
        }
        if (message.key_id().empty()) {
            return Result<EncryptedPackage, QkdFailure>::Err(QkdFailure::Decode("Package has no key_id"));
        }
        if (message.sender_id().empty()) {
            return Result<EncryptedPackage, QkdFailure>::Err(QkdFailure::Decode("Package has no sender_id"));
        }
        if (!message.has_metadata()) {
            return Result<EncryptedPackage, QkdFailure>::Err(QkdFailure::Decode("Package has no cipher metadata"));
        }
        auto metadata = MetadataCodec::FromProto(message.metadata());
        if (metadata.IsErr()) {
            return Result<EncryptedPackage, QkdFailure>::Err(std::move(metadata).UnwrapErr());
        }
        return Result<EncryptedPackage, QkdFailure>::Ok(EncryptedPackage{
            std::vector<uint8_t>(message.ciphertext().begin(), message.ciphertext().end()),
            message.key_id(),
            std::move(metadata).Unwrap(),
            message.sender_id(),
            message.protocol(),
            message.version()});
    }

    Result<std::string, QkdFailure> PackageCodec::Armor(const EncryptedPackage& package) {
        auto bytes = Serialize(package);
        if (bytes.IsErr()) {
            return Result<std::string, QkdFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return Result<std::string, QkdFailure>::Ok(SodiumInterop::ToBase64(bytes.Unwrap()));
    }

    Result<EncryptedPackage, QkdFailure> PackageCodec::Dearmor(const std::string_view armored) {
        auto bytes = SodiumInterop::FromBase64(armored);
        if (bytes.IsErr()) {
            return Result<EncryptedPackage, QkdFailure>::Err(
                QkdFailure::Decode("Armored package is not valid Base64"));
        }
        return Parse(bytes.Unwrap());
    }
}
