#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/interfaces/i_kme_transport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace qkmail::providers {

/// Body of GET /keys/{slave_SAE_ID}/status; absent fields stay empty
struct KeyStreamStatus {
    std::optional<uint64_t> stored_key_count;
    std::optional<uint32_t> max_key_size;
    std::optional<std::chrono::seconds> key_expiry_time;
};

/// One element of a Key Container "keys" array, key still base64-encoded
struct KeyContainerEntry {
    std::string key_id;
    std::string key_base64;
};

/**
 * @brief Thin ETSI GS QKD 014 REST client
 *
 * Issues status, enc_keys and dec_keys calls through an IKmeTransport and
 * classifies failures:
 * - no HTTP response, or a non-2xx answer that is not JSON: ProviderTransport
 * - a JSON body carrying "error" or a non-empty "errors" (any status), or a
 *   non-2xx JSON body with "message": ProviderProtocol
 * - a 2xx body that is not a JSON object: ProviderProtocol
 */
class EtsiKmeClient {
public:
    EtsiKmeClient(std::shared_ptr<interfaces::IKmeTransport> transport, std::string base_path);

    [[nodiscard]] Result<KeyStreamStatus, QkdFailure> GetStatus(const std::string& slave_sae_id);

    [[nodiscard]] Result<std::vector<KeyContainerEntry>, QkdFailure> GetKeys(
        const std::string& slave_sae_id,
        uint32_t number,
        uint32_t size_bits);

    /// One dec_keys call per id; entries are concatenated in request order
    [[nodiscard]] Result<std::vector<KeyContainerEntry>, QkdFailure> GetKeysById(
        const std::string& master_sae_id,
        const std::vector<std::string>& key_ids);

    /// RFC 3986 percent-encoding of everything but unreserved characters
    [[nodiscard]] static std::string PercentEncode(std::string_view value);

    /// True for key_ID under any casing or underscore placement
    [[nodiscard]] static bool IsKeyIdField(std::string_view name);

private:
    std::shared_ptr<interfaces::IKmeTransport> transport_;
    std::string base_path_;
};
}
