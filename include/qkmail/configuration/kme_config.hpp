#pragma once

#include "qkmail/core/constants.hpp"
#include "qkmail/core/format.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace qkmail::configuration {

/// Connection settings for one SAE talking to its Key Management Entity
///
/// The SAE identity presented to the KME is the TLS client certificate; the
/// `sae_id` field is only used locally to enforce master/slave roles.
struct KmeConfig {
    std::string host;
    uint16_t port = EtsiConstants::HTTPS_PORT;
    std::string base_path = std::string(EtsiConstants::API_BASE_PATH);
    std::string sae_id;
    std::string ca_cert_path;
    std::string client_cert_path;
    std::string client_key_path;
    std::chrono::milliseconds timeout = EtsiConstants::DEFAULT_TIMEOUT;

    /// QuKayDee cloud simulator: https://{kme}.acct-{account}.etsi-qkd-api.qukaydee.com/api/v1
    [[nodiscard]] static KmeConfig ForQuKayDee(
        const std::string& account_id,
        const std::string& kme_id,
        std::string sae_id,
        std::string ca_cert_path,
        std::string client_cert_path,
        std::string client_key_path) {
        KmeConfig config;
        config.host = kme_id + ".acct-" + account_id + "." + std::string(EtsiConstants::QUKAYDEE_DOMAIN);
        config.sae_id = std::move(sae_id);
        config.ca_cert_path = std::move(ca_cert_path);
        config.client_cert_path = std::move(client_cert_path);
        config.client_key_path = std::move(client_key_path);
        return config;
    }

    [[nodiscard]] std::string BaseUrl() const {
        if (port == EtsiConstants::HTTPS_PORT) {
            return compat::format("https://{}{}", host, base_path);
        }
        return compat::format("https://{}:{}{}", host, port, base_path);
    }
};

} // namespace qkmail::configuration
