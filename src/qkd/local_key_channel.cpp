#include "qkmail/qkd/local_key_channel.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/debug/event_logger.hpp"

namespace qkmail::qkd {

using crypto::SodiumInterop;
using debug::Role;

LocalKeyChannel::LocalKeyChannel(configuration::SimulatorConfig config)
    : simulator_(config) {}

LocalKeyChannel::~LocalKeyChannel() {
    for (auto& [key_id, record] : key_store_) {
        SodiumInterop::Wipe(record.key);
    }
}

Result<GeneratedKey, QkdFailure> LocalKeyChannel::EstablishKeyPair(
    const std::string& party_a,
    const std::string& party_b,
    const std::optional<uint32_t> key_length_bits) {

    if (party_a.empty() || party_b.empty()) {
        return Result<GeneratedKey, QkdFailure>::Err(
            QkdFailure::InvalidInput("Both party identifiers are required"));
    }

    auto generated = simulator_.GenerateQuantumKey(
        key_length_bits.value_or(simulator_.Config().DefaultKeyLengthBits()));
    if (generated.IsErr()) {
        return generated;
    }
    const GeneratedKey& key = generated.Unwrap();

    {
        std::lock_guard<std::mutex> guard(lock_);
        key_store_.insert_or_assign(key.key_id, ChannelRecord{key.key_bytes, party_a, party_b});
    }
    QKM_LOG_EVENT(Role::Local, "channel", "established " + key.key_id + " " + party_a + "<->" + party_b);

    return generated;
}

Result<std::vector<uint8_t>, QkdFailure> LocalKeyChannel::GetKey(const std::string& key_id) const {
    std::lock_guard<std::mutex> guard(lock_);
    const auto it = key_store_.find(key_id);
    if (it == key_store_.end()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(
            QkdFailure::KeyNotFound("Key ID " + key_id + " not found"));
    }
    return Result<std::vector<uint8_t>, QkdFailure>::Ok(it->second.key);
}

bool LocalKeyChannel::Remove(const std::string& key_id) {
    std::lock_guard<std::mutex> guard(lock_);
    const auto it = key_store_.find(key_id);
    if (it == key_store_.end()) {
        return false;
    }
    SodiumInterop::Wipe(it->second.key);
    key_store_.erase(it);
    QKM_LOG_EVENT(Role::Local, "channel", "delivered " + key_id);
    return true;
}

size_t LocalKeyChannel::Size() const {
    std::lock_guard<std::mutex> guard(lock_);
    return key_store_.size();
}

} // namespace qkmail::qkd
