#include "qkmail/providers/remote_key_provider.hpp"
#include "qkmail/providers/https_kme_transport.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/format.hpp"
#include "qkmail/debug/event_logger.hpp"
#include <stdexcept>
namespace qkmail::providers {
using interfaces::ProvisionedKey;
using interfaces::ProvenanceMetadata;
using crypto::SodiumInterop;
using debug::Role;
namespace {
    ProvenanceMetadata EtsiProvenance(std::optional<std::chrono::seconds> expires_in) {
        return ProvenanceMetadata{
            std::string(EtsiConstants::PROVIDER_SOURCE),
            std::string(EtsiConstants::STANDARD),
            expires_in};
    }

    Result<std::vector<uint8_t>, QkdFailure> DecodeKeyMaterial(const KeyContainerEntry& entry) {
        auto decoded = SodiumInterop::FromBase64(entry.key_base64);
        if (decoded.IsErr()) {
            return Result<std::vector<uint8_t>, QkdFailure>::Err(
                QkdFailure::ProviderProtocol("Invalid Base64 key for key_ID " + entry.key_id));
        }
        if (decoded.Unwrap().empty()) {
            return Result<std::vector<uint8_t>, QkdFailure>::Err(
                QkdFailure::ProviderProtocol("Empty key material for key_ID " + entry.key_id));
        }
        return Result<std::vector<uint8_t>, QkdFailure>::Ok(std::move(decoded).Unwrap());
    }
}
RemoteKeyProvider::RemoteKeyProvider(
    std::string sae_id,
    std::string base_path,
    std::shared_ptr<interfaces::IKmeTransport> transport)
    : sae_id_(std::move(sae_id)), client_(std::move(transport), std::move(base_path)) {
    if (sae_id_.empty()) {
        throw std::invalid_argument("RemoteKeyProvider requires an SAE id");
    }
}
Result<std::unique_ptr<RemoteKeyProvider>, QkdFailure> RemoteKeyProvider::Connect(
    const configuration::KmeConfig& config) {
    if (config.sae_id.empty()) {
        return Result<std::unique_ptr<RemoteKeyProvider>, QkdFailure>::Err(
            QkdFailure::InvalidInput("KME configuration has no SAE id"));
    }
    auto transport = HttpsKmeTransport::Create(config);
    if (transport.IsErr()) {
        return Result<std::unique_ptr<RemoteKeyProvider>, QkdFailure>::Err(std::move(transport).UnwrapErr());
    }
    std::shared_ptr<interfaces::IKmeTransport> shared_transport = std::move(transport).Unwrap();
    return Result<std::unique_ptr<RemoteKeyProvider>, QkdFailure>::Ok(
        std::make_unique<RemoteKeyProvider>(config.sae_id, config.base_path, std::move(shared_transport)));
}
Result<ProvisionedKey, QkdFailure> RemoteKeyProvider::RequestKey(
    const std::string& sender_id,
    const std::string& receiver_id,
    const uint32_t size_bits) {
    QKM_LOG_SECTION(Role::Master, "enc_keys");
    if (sender_id != sae_id_) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::KeyPolicy("Configured SAE (" + sae_id_ + ") cannot act as " + sender_id));
    }
    if (receiver_id.empty() || receiver_id == sae_id_) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::KeyPolicy("Receiver SAE must differ from the configured SAE"));
    }
    if (size_bits == 0) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::InvalidInput("Requested key size must be positive"));
    }

    auto status_result = client_.GetStatus(receiver_id);
    if (status_result.IsErr()) {
        return Result<ProvisionedKey, QkdFailure>::Err(std::move(status_result).UnwrapErr());
    }
    const KeyStreamStatus& status = status_result.Unwrap();
    if (status.stored_key_count.value_or(0) == 0) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::KeyPolicy("No keys available in key stream to " + receiver_id));
    }
    if (status.max_key_size && size_bits > *status.max_key_size) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::KeyPolicy(compat::format("Requested key too large ({} > {})",
                size_bits, *status.max_key_size)));
    }
    QKM_LOG_VALUE(Role::Master, "enc_keys", "stored_key_count", status.stored_key_count.value_or(0));

    auto keys_result = client_.GetKeys(receiver_id, 1, size_bits);
    if (keys_result.IsErr()) {
        return Result<ProvisionedKey, QkdFailure>::Err(std::move(keys_result).UnwrapErr());
    }
    const auto& keys = keys_result.Unwrap();
    if (keys.empty()) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::ProviderProtocol("No keys returned by enc_keys"));
    }

    auto key_bytes = DecodeKeyMaterial(keys.front());
    if (key_bytes.IsErr()) {
        return Result<ProvisionedKey, QkdFailure>::Err(std::move(key_bytes).UnwrapErr());
    }
    ProvisionedKey provisioned{
        keys.front().key_id,
        std::move(key_bytes).Unwrap(),
        EtsiProvenance(status.key_expiry_time.value_or(EtsiConstants::DEFAULT_KEY_EXPIRY))};
    QKM_LOG_KEY(Role::Master, "enc_keys", provisioned.key_id, std::span<const uint8_t>(provisioned.key_bytes));
    return Result<ProvisionedKey, QkdFailure>::Ok(std::move(provisioned));
}
Result<ProvisionedKey, QkdFailure> RemoteKeyProvider::RetrieveKey(
    const std::string& originator_id,
    const std::string& key_id) {
    QKM_LOG_SECTION(Role::Slave, "dec_keys");
    if (originator_id == sae_id_) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::KeyPolicy("Slave SAE cannot retrieve keys it originally requested"));
    }
    if (originator_id.empty() || key_id.empty()) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::InvalidInput("Originator SAE and key_ID are required"));
    }

    auto keys_result = client_.GetKeysById(originator_id, {key_id});
    if (keys_result.IsErr()) {
        return Result<ProvisionedKey, QkdFailure>::Err(std::move(keys_result).UnwrapErr());
    }
    const auto& keys = keys_result.Unwrap();
    if (keys.empty()) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::KeyLifecycleMiss(compat::format("Key {} not found or expired", key_id)));
    }
    if (keys.front().key_id != key_id) {
        return Result<ProvisionedKey, QkdFailure>::Err(
            QkdFailure::ProviderProtocol(compat::format("KME answered key_ID {} for requested key_ID {}",
                keys.front().key_id, key_id)));
    }

    auto key_bytes = DecodeKeyMaterial(keys.front());
    if (key_bytes.IsErr()) {
        return Result<ProvisionedKey, QkdFailure>::Err(std::move(key_bytes).UnwrapErr());
    }
    ProvisionedKey provisioned{
        key_id,
        std::move(key_bytes).Unwrap(),
        EtsiProvenance(std::nullopt)};
    QKM_LOG_KEY(Role::Slave, "dec_keys", provisioned.key_id, std::span<const uint8_t>(provisioned.key_bytes));
    return Result<ProvisionedKey, QkdFailure>::Ok(std::move(provisioned));
}
}
