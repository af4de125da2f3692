#include "qkmail/keys/key_exchange.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/debug/event_logger.hpp"
#include <stdexcept>
namespace qkmail::keys {
using crypto::SodiumInterop;
using debug::Role;
KeyExchange::KeyExchange(std::shared_ptr<qkd::LocalKeyChannel> channel)
    : channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("KeyExchange requires a key channel");
    }
}
Result<std::string, QkdFailure> KeyExchange::EstablishSharedKey(
    KeyManager& initiator,
    KeyManager& responder,
    const std::optional<uint32_t> key_length_bits) {
    QKM_LOG_SECTION(Role::Master, "key_exchange");
    if (initiator.OwnerId() == responder.OwnerId()) {
        return Result<std::string, QkdFailure>::Err(
            QkdFailure::InvalidInput("Key exchange needs two distinct parties"));
    }
    auto generated = channel_->EstablishKeyPair(initiator.OwnerId(), responder.OwnerId(), key_length_bits);
    if (generated.IsErr()) {
        return Result<std::string, QkdFailure>::Err(std::move(generated).UnwrapErr());
    }
    qkd::GeneratedKey key = std::move(generated).Unwrap();
    channel_->Remove(key.key_id);
    const auto length_bits = static_cast<uint32_t>(key.key_bytes.size() * Constants::BITS_PER_BYTE);

    const KeyMetadata initiator_metadata{
        responder.OwnerId(),
        KeyRole::Master,
        std::string(QkdConstants::LOCAL_PROVENANCE),
        std::string(KeyPolicyConstants::EXCHANGE_PURPOSE),
        length_bits};
    auto stored = initiator.StoreKey(key.key_id, key.key_bytes, initiator_metadata);
    if (stored.IsErr() || !stored.Unwrap()) {
        SodiumInterop::Wipe(key.key_bytes);
        if (stored.IsErr()) {
            return Result<std::string, QkdFailure>::Err(std::move(stored).UnwrapErr());
        }
        return Result<std::string, QkdFailure>::Err(
            QkdFailure::KeyPolicy("Initiator already holds key id " + key.key_id));
    }

    const KeyMetadata responder_metadata{
        initiator.OwnerId(),
        KeyRole::Slave,
        std::string(QkdConstants::LOCAL_PROVENANCE),
        std::string(KeyPolicyConstants::EXCHANGE_PURPOSE),
        length_bits};
    auto mirrored = responder.StoreKey(key.key_id, key.key_bytes, responder_metadata);
    SodiumInterop::Wipe(key.key_bytes);
    if (mirrored.IsErr() || !mirrored.Unwrap()) {
        auto rollback = initiator.DeleteKey(key.key_id);
        if (rollback.IsErr()) {
            QKM_LOG_EVENT(Role::Master, "key_exchange", "rollback failed: " + rollback.UnwrapErr().message);
        }
        if (mirrored.IsErr()) {
            return Result<std::string, QkdFailure>::Err(std::move(mirrored).UnwrapErr());
        }
        return Result<std::string, QkdFailure>::Err(
            QkdFailure::KeyPolicy("Responder already holds key id " + key.key_id));
    }
    QKM_LOG_EVENT(Role::Master, "key_exchange", "shared " + key.key_id);
    return Result<std::string, QkdFailure>::Ok(std::move(key.key_id));
}
}
