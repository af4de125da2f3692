#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/core/constants.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace qkmail::interfaces {

struct ProvenanceMetadata {
    std::string source;
    std::string standard;
    /// Lifetime the provider grants the key, when it states one
    std::optional<std::chrono::seconds> expires_in;

    [[nodiscard]] std::string Label() const {
        if (source == QkdConstants::LOCAL_PROVENANCE) {
            return source;
        }
        return source + "/" + standard;
    }
};

struct ProvisionedKey {
    std::string key_id;
    std::vector<uint8_t> key_bytes;
    ProvenanceMetadata provenance;
};

/**
 * Source of shared quantum keys for one party.
 *
 * RequestKey is the originator (master) side and creates a key shared with
 * @p receiver_id. RetrieveKey is the recipient (slave) side and fetches the
 * key the originator already requested.
 */
class IQkdKeyProvider {
public:
    virtual ~IQkdKeyProvider() = default;
    [[nodiscard]] virtual Result<ProvisionedKey, QkdFailure> RequestKey(
        const std::string& sender_id,
        const std::string& receiver_id,
        uint32_t size_bits) = 0;
    [[nodiscard]] virtual Result<ProvisionedKey, QkdFailure> RetrieveKey(
        const std::string& originator_id,
        const std::string& key_id) = 0;
};
}
