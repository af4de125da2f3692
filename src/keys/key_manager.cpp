#include "qkmail/keys/key_manager.hpp"
#include "qkmail/keys/key_id.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/debug/event_logger.hpp"
#include <algorithm>
#include <stdexcept>
namespace qkmail::keys {
using crypto::SodiumInterop;
using debug::Role;
using interfaces::ProvisionedKey;
KeyManager::KeyManager(
    std::string owner_id,
    std::unique_ptr<interfaces::IKeyRepository> repository,
    std::shared_ptr<interfaces::IQkdKeyProvider> provider,
    const configuration::KeyPolicy policy,
    Clock clock)
    : owner_id_(std::move(owner_id)),
      repository_(std::move(repository)),
      provider_(std::move(provider)),
      policy_(policy),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {
    if (owner_id_.empty()) {
        throw std::invalid_argument("KeyManager requires an owner id");
    }
    if (!repository_) {
        throw std::invalid_argument("KeyManager requires a key repository");
    }
}
std::chrono::seconds KeyManager::EffectiveTtl(const interfaces::ProvenanceMetadata& provenance) const {
    if (provenance.expires_in && *provenance.expires_in < policy_.Ttl()) {
        return *provenance.expires_in;
    }
    return policy_.Ttl();
}
Result<QuantumKey, QkdFailure> KeyManager::RequestQuantumKey(
    const std::string& peer_id,
    const uint32_t key_length_bits) {
    QKM_LOG_SECTION(Role::Master, "request_quantum_key");
    if (!provider_) {
        return Result<QuantumKey, QkdFailure>::Err(
            QkdFailure::KeyPolicy("No QKD provider configured for " + owner_id_));
    }
    if (peer_id.empty()) {
        return Result<QuantumKey, QkdFailure>::Err(QkdFailure::InvalidInput("Peer id is empty"));
    }
    auto provisioned = provider_->RequestKey(owner_id_, peer_id, key_length_bits);
    if (provisioned.IsErr()) {
        return Result<QuantumKey, QkdFailure>::Err(std::move(provisioned).UnwrapErr());
    }
    ProvisionedKey key = std::move(provisioned).Unwrap();

    const KeyMetadata metadata{
        peer_id,
        KeyRole::Master,
        key.provenance.Label(),
        "",
        static_cast<uint32_t>(key.key_bytes.size() * Constants::BITS_PER_BYTE)};

    std::lock_guard<std::mutex> guard(lock_);
    auto stored = StoreLocked(key.key_id, key.key_bytes, metadata, EffectiveTtl(key.provenance));
    SodiumInterop::Wipe(key.key_bytes);
    if (stored.IsErr()) {
        return Result<QuantumKey, QkdFailure>::Err(std::move(stored).UnwrapErr());
    }
    if (!stored.Unwrap()) {
        return Result<QuantumKey, QkdFailure>::Err(
            QkdFailure::ProviderProtocol("Provider reissued key id " + key.key_id));
    }
    return TakeFirstUse(key.key_id);
}
Result<QuantumKey, QkdFailure> KeyManager::RetrieveQuantumKey(
    const std::string& originator_id,
    const std::string& key_id) {
    QKM_LOG_SECTION(Role::Slave, "retrieve_quantum_key");
    if (auto valid = ValidateKeyId(key_id); valid.IsErr()) {
        return Result<QuantumKey, QkdFailure>::Err(std::move(valid).UnwrapErr());
    }
    {
        std::lock_guard<std::mutex> guard(lock_);
        auto retired = repository_->IsRetired(key_id);
        if (retired.IsErr()) {
            return Result<QuantumKey, QkdFailure>::Err(std::move(retired).UnwrapErr());
        }
        if (retired.Unwrap()) {
            return Result<QuantumKey, QkdFailure>::Err(
                QkdFailure::KeyLifecycleMiss("Key " + key_id + " was deleted"));
        }
        auto existing = repository_->Find(key_id);
        if (existing.IsErr()) {
            return Result<QuantumKey, QkdFailure>::Err(std::move(existing).UnwrapErr());
        }
        if (existing.Unwrap().has_value()) {
            auto entry = GetKeyLocked(key_id);
            if (entry.IsErr()) {
                return Result<QuantumKey, QkdFailure>::Err(std::move(entry).UnwrapErr());
            }
            auto& found = entry.Unwrap();
            if (!found) {
                return Result<QuantumKey, QkdFailure>::Err(
                    QkdFailure::KeyLifecycleMiss("Key " + key_id + " is no longer active"));
            }
            QKM_LOG_EVENT(Role::Slave, "retrieve_quantum_key", "served from local table");
            return Result<QuantumKey, QkdFailure>::Ok(
                QuantumKey{found->key_id, std::move(found->key_bytes)});
        }
    }

    if (!provider_) {
        return Result<QuantumKey, QkdFailure>::Err(
            QkdFailure::KeyLifecycleMiss("Key " + key_id + " is not stored and no provider is configured"));
    }
    auto provisioned = provider_->RetrieveKey(originator_id, key_id);
    if (provisioned.IsErr()) {
        return Result<QuantumKey, QkdFailure>::Err(std::move(provisioned).UnwrapErr());
    }
    ProvisionedKey key = std::move(provisioned).Unwrap();

    const KeyMetadata metadata{
        originator_id,
        KeyRole::Slave,
        key.provenance.Label(),
        "",
        static_cast<uint32_t>(key.key_bytes.size() * Constants::BITS_PER_BYTE)};

    std::lock_guard<std::mutex> guard(lock_);
    auto stored = StoreLocked(key_id, key.key_bytes, metadata, EffectiveTtl(key.provenance));
    SodiumInterop::Wipe(key.key_bytes);
    if (stored.IsErr()) {
        return Result<QuantumKey, QkdFailure>::Err(std::move(stored).UnwrapErr());
    }
    return TakeFirstUse(key_id);
}
Result<QuantumKey, QkdFailure> KeyManager::TakeFirstUse(const std::string& key_id) {
    auto entry = GetKeyLocked(key_id);
    if (entry.IsErr()) {
        return Result<QuantumKey, QkdFailure>::Err(std::move(entry).UnwrapErr());
    }
    auto& found = entry.Unwrap();
    if (!found) {
        return Result<QuantumKey, QkdFailure>::Err(
            QkdFailure::KeyLifecycleMiss("Key " + key_id + " expired before first use"));
    }
    return Result<QuantumKey, QkdFailure>::Ok(QuantumKey{found->key_id, std::move(found->key_bytes)});
}
Result<std::optional<KeyEntry>, QkdFailure> KeyManager::GetKey(const std::string& key_id) {
    std::lock_guard<std::mutex> guard(lock_);
    return GetKeyLocked(key_id);
}
Result<std::optional<KeyEntry>, QkdFailure> KeyManager::GetKeyLocked(const std::string& key_id) {
    auto found = repository_->Find(key_id);
    if (found.IsErr()) {
        return found;
    }
    std::optional<KeyEntry>& slot = found.Unwrap();
    if (!slot || slot->state != KeyState::Active) {
        return Result<std::optional<KeyEntry>, QkdFailure>::Ok(std::nullopt);
    }
    KeyEntry entry = std::move(*slot);

    if (entry.IsExpiredAt(clock_())) {
        QKM_LOG_EVENT(Role::Local, "get_key", "expired " + key_id);
        auto retired = RetireEntry(std::move(entry), KeyState::Expired);
        if (retired.IsErr()) {
            return Result<std::optional<KeyEntry>, QkdFailure>::Err(std::move(retired).UnwrapErr());
        }
        return Result<std::optional<KeyEntry>, QkdFailure>::Ok(std::nullopt);
    }
    if (entry.IsUsageExhausted()) {
        auto retired = RetireEntry(std::move(entry), KeyState::Consumed);
        if (retired.IsErr()) {
            return Result<std::optional<KeyEntry>, QkdFailure>::Err(std::move(retired).UnwrapErr());
        }
        return Result<std::optional<KeyEntry>, QkdFailure>::Ok(std::nullopt);
    }

    entry.usage_count += 1;
    if (entry.IsUsageExhausted()) {
        KeyEntry served = entry;
        auto retired = RetireEntry(std::move(entry), KeyState::Consumed);
        if (retired.IsErr()) {
            SodiumInterop::Wipe(served.key_bytes);
            return Result<std::optional<KeyEntry>, QkdFailure>::Err(std::move(retired).UnwrapErr());
        }
        served.state = KeyState::Consumed;
        QKM_LOG_VALUE(Role::Local, "get_key", "final_use", served.usage_count);
        return Result<std::optional<KeyEntry>, QkdFailure>::Ok(std::move(served));
    }
    auto updated = repository_->Update(entry);
    if (updated.IsErr()) {
        SodiumInterop::Wipe(entry.key_bytes);
        return Result<std::optional<KeyEntry>, QkdFailure>::Err(std::move(updated).UnwrapErr());
    }
    QKM_LOG_VALUE(Role::Local, "get_key", "usage_count", entry.usage_count);
    return Result<std::optional<KeyEntry>, QkdFailure>::Ok(std::move(entry));
}
Result<Unit, QkdFailure> KeyManager::RetireEntry(KeyEntry entry, const KeyState state) {
    entry.state = state;
    SodiumInterop::Wipe(entry.key_bytes);
    entry.key_bytes.clear();
    return repository_->Update(entry);
}
Result<bool, QkdFailure> KeyManager::StoreKey(
    const std::string& key_id,
    const std::vector<uint8_t>& key_bytes,
    const KeyMetadata& metadata) {
    std::lock_guard<std::mutex> guard(lock_);
    return StoreLocked(key_id, key_bytes, metadata, policy_.Ttl());
}
Result<bool, QkdFailure> KeyManager::StoreLocked(
    const std::string& key_id,
    const std::vector<uint8_t>& key_bytes,
    const KeyMetadata& metadata,
    const std::chrono::seconds ttl) {
    if (auto valid = ValidateKeyId(key_id); valid.IsErr()) {
        return Result<bool, QkdFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (key_bytes.empty()) {
        return Result<bool, QkdFailure>::Err(QkdFailure::InvalidInput("Key material is empty"));
    }
    auto retired = repository_->IsRetired(key_id);
    if (retired.IsErr()) {
        return Result<bool, QkdFailure>::Err(std::move(retired).UnwrapErr());
    }
    if (retired.Unwrap()) {
        return Result<bool, QkdFailure>::Ok(false);
    }
    const TimePoint now = clock_();
    KeyEntry entry;
    entry.key_id = key_id;
    entry.key_bytes = key_bytes;
    entry.created_at = now;
    entry.expires_at = now + ttl;
    entry.usage_count = 0;
    entry.max_usage = policy_.MaxUsage();
    entry.state = KeyState::Active;
    entry.metadata = metadata;
    if (entry.metadata.key_length_bits == 0) {
        entry.metadata.key_length_bits = static_cast<uint32_t>(key_bytes.size() * Constants::BITS_PER_BYTE);
    }
    auto inserted = repository_->Insert(entry);
    SodiumInterop::Wipe(entry.key_bytes);
    if (inserted.IsOk() && inserted.Unwrap()) {
        QKM_LOG_KEY(Role::Local, "store_key", key_id, std::span<const uint8_t>(key_bytes));
    }
    return inserted;
}
Result<bool, QkdFailure> KeyManager::DeleteKey(const std::string& key_id) {
    std::lock_guard<std::mutex> guard(lock_);
    auto erased = repository_->SecureErase(key_id);
    if (erased.IsOk() && erased.Unwrap()) {
        QKM_LOG_EVENT(Role::Local, "delete_key", "retired " + key_id);
    }
    return erased;
}
Result<size_t, QkdFailure> KeyManager::CleanupExpiredKeys() {
    std::lock_guard<std::mutex> guard(lock_);
    auto ids = repository_->ListKeyIds();
    if (ids.IsErr()) {
        return Result<size_t, QkdFailure>::Err(std::move(ids).UnwrapErr());
    }
    const TimePoint now = clock_();
    size_t removed = 0;
    for (const std::string& key_id : ids.Unwrap()) {
        auto found = repository_->Find(key_id);
        if (found.IsErr()) {
            return Result<size_t, QkdFailure>::Err(std::move(found).UnwrapErr());
        }
        std::optional<KeyEntry>& entry = found.Unwrap();
        if (!entry) {
            continue;
        }
        const bool stale = entry->state != KeyState::Active || entry->IsExpiredAt(now);
        SodiumInterop::Wipe(entry->key_bytes);
        if (!stale) {
            continue;
        }
        auto erased = repository_->SecureErase(key_id);
        if (erased.IsErr()) {
            return Result<size_t, QkdFailure>::Err(std::move(erased).UnwrapErr());
        }
        if (erased.Unwrap()) {
            ++removed;
        }
    }
    QKM_LOG_VALUE(Role::Local, "cleanup", "removed", removed);
    return Result<size_t, QkdFailure>::Ok(removed);
}
Result<std::vector<KeySummary>, QkdFailure> KeyManager::ListKeys() {
    std::lock_guard<std::mutex> guard(lock_);
    auto ids = repository_->ListKeyIds();
    if (ids.IsErr()) {
        return Result<std::vector<KeySummary>, QkdFailure>::Err(std::move(ids).UnwrapErr());
    }
    const TimePoint now = clock_();
    std::vector<KeySummary> summaries;
    summaries.reserve(ids.Unwrap().size());
    for (const std::string& key_id : ids.Unwrap()) {
        auto found = repository_->Find(key_id);
        if (found.IsErr()) {
            return Result<std::vector<KeySummary>, QkdFailure>::Err(std::move(found).UnwrapErr());
        }
        std::optional<KeyEntry>& entry = found.Unwrap();
        if (!entry) {
            continue;
        }
        SodiumInterop::Wipe(entry->key_bytes);
        KeySummary summary{
            entry->key_id,
            entry->created_at,
            entry->expires_at,
            entry->usage_count,
            entry->max_usage,
            entry->state,
            entry->metadata};
        if (summary.state == KeyState::Active && entry->IsExpiredAt(now)) {
            summary.state = KeyState::Expired;
        }
        summaries.push_back(std::move(summary));
    }
    std::sort(summaries.begin(), summaries.end(),
        [](const KeySummary& a, const KeySummary& b) { return a.created_at < b.created_at; });
    return Result<std::vector<KeySummary>, QkdFailure>::Ok(std::move(summaries));
}
}
