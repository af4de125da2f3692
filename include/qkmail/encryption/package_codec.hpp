#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/encryption/cipher_metadata.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace qkmail::proto::envelope {
    class CipherMetadata;
}
namespace qkmail::encryption {

/// What a sender transmits to the recipient alongside nothing else
struct EncryptedPackage {
    std::vector<uint8_t> ciphertext;
    std::string key_id;
    CipherMetadata metadata;
    std::string sender_id;
    std::string protocol;
    std::string version;
};

/// Converts between CipherMetadata and its wire message; FromProto does all field validation
class MetadataCodec {
public:
    [[nodiscard]] static proto::envelope::CipherMetadata ToProto(const CipherMetadata& metadata);
    [[nodiscard]] static Result<CipherMetadata, QkdFailure> FromProto(
        const proto::envelope::CipherMetadata& message);
private:
    MetadataCodec() = delete;
};

class PackageCodec {
public:
    [[nodiscard]] static EncryptedPackage BuildPackage(
        std::vector<uint8_t> ciphertext,
        std::string key_id,
        CipherMetadata metadata,
        std::string sender_id);

    [[nodiscard]] static Result<std::vector<uint8_t>, QkdFailure> Serialize(const EncryptedPackage& package);

    /// Rejects a foreign protocol tag, empty key or sender id, and missing or invalid metadata
    [[nodiscard]] static Result<EncryptedPackage, QkdFailure> Parse(std::span<const uint8_t> bytes);

    /// Base64 text of the serialized package, for embedding in a message body
    [[nodiscard]] static Result<std::string, QkdFailure> Armor(const EncryptedPackage& package);
    [[nodiscard]] static Result<EncryptedPackage, QkdFailure> Dearmor(std::string_view armored);
private:
    PackageCodec() = delete;
};

} // namespace qkmail::encryption
