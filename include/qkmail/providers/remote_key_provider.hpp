#pragma once
#include "qkmail/interfaces/i_qkd_key_provider.hpp"
#include "qkmail/interfaces/i_kme_transport.hpp"
#include "qkmail/configuration/kme_config.hpp"
#include "qkmail/providers/etsi_kme_client.hpp"
#include <memory>
#include <string>
namespace qkmail::providers {

/**
 * @brief Key provider for an ETSI GS QKD 014 KME (QuKayDee and compatible)
 *
 * Master flow (RequestKey): status check on the receiver's key stream, then
 * enc_keys for one key of the requested size. Slave flow (RetrieveKey):
 * dec_keys by key_ID on the originator's stream.
 *
 * The configured SAE id must act as the sender of every RequestKey and may
 * never retrieve a key it originated. The id itself is never sent; the KME
 * identifies the caller by its TLS client certificate.
 */
class RemoteKeyProvider final : public interfaces::IQkdKeyProvider {
public:
    RemoteKeyProvider(
        std::string sae_id,
        std::string base_path,
        std::shared_ptr<interfaces::IKmeTransport> transport);

    /// Opens an HTTPS transport with the SAE credentials named in @p config
    [[nodiscard]] static Result<std::unique_ptr<RemoteKeyProvider>, QkdFailure> Connect(
        const configuration::KmeConfig& config);

    [[nodiscard]] Result<interfaces::ProvisionedKey, QkdFailure> RequestKey(
        const std::string& sender_id,
        const std::string& receiver_id,
        uint32_t size_bits) override;

    [[nodiscard]] Result<interfaces::ProvisionedKey, QkdFailure> RetrieveKey(
        const std::string& originator_id,
        const std::string& key_id) override;

    [[nodiscard]] const std::string& SaeId() const noexcept { return sae_id_; }

private:
    std::string sae_id_;
    EtsiKmeClient client_;
};
}
