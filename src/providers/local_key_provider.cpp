#include "qkmail/providers/local_key_provider.hpp"
#include "qkmail/debug/event_logger.hpp"
#include <stdexcept>
namespace qkmail::providers {
using interfaces::ProvisionedKey;
using interfaces::ProvenanceMetadata;
using debug::Role;
namespace {
    ProvenanceMetadata LocalProvenance() {
        return ProvenanceMetadata{
            std::string(QkdConstants::LOCAL_PROVENANCE),
            std::string(QkdConstants::LOCAL_STANDARD),
            std::nullopt};
    }
}
LocalKeyProvider::LocalKeyProvider(std::shared_ptr<qkd::LocalKeyChannel> channel)
    : channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("LocalKeyProvider requires a key channel");
    }
}
Result<ProvisionedKey, QkdFailure> LocalKeyProvider::RequestKey(
    const std::string& sender_id,
    const std::string& receiver_id,
    const uint32_t size_bits) {
    QKM_LOG_EVENT(Role::Master, "local.request", sender_id + " -> " + receiver_id);
    auto established = channel_->EstablishKeyPair(sender_id, receiver_id, size_bits);
    if (established.IsErr()) {
        return Result<ProvisionedKey, QkdFailure>::Err(std::move(established).UnwrapErr());
    }
    qkd::GeneratedKey generated = std::move(established).Unwrap();
    return Result<ProvisionedKey, QkdFailure>::Ok(ProvisionedKey{
        std::move(generated.key_id),
        std::move(generated.key_bytes),
        LocalProvenance()});
}
Result<ProvisionedKey, QkdFailure> LocalKeyProvider::RetrieveKey(
    const std::string& originator_id,
    const std::string& key_id) {
    QKM_LOG_EVENT(Role::Slave, "local.retrieve", key_id + " from " + originator_id);
    auto key = channel_->GetKey(key_id);
    if (key.IsErr()) {
        const QkdFailure& failure = key.UnwrapErr();
        if (failure.type == QkdFailureType::KeyNotFound) {
            return Result<ProvisionedKey, QkdFailure>::Err(
                QkdFailure::KeyLifecycleMiss(failure.message));
        }
        return Result<ProvisionedKey, QkdFailure>::Err(std::move(key).UnwrapErr());
    }
    channel_->Remove(key_id);
    return Result<ProvisionedKey, QkdFailure>::Ok(ProvisionedKey{
        key_id,
        std::move(key).Unwrap(),
        LocalProvenance()});
}
}
