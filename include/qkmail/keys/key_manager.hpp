#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/configuration/key_policy.hpp"
#include "qkmail/interfaces/i_key_repository.hpp"
#include "qkmail/interfaces/i_qkd_key_provider.hpp"
#include "qkmail/keys/key_entry.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
namespace qkmail::keys {

struct QuantumKey {
    std::string key_id;
    std::vector<uint8_t> key_bytes;
};

/**
 * @brief One party's quantum key table with lifetime and usage enforcement
 *
 * Every key carries an expiry (policy TTL, shortened to the provider's
 * lifetime when it states one) and an optional usage cap. GetKey counts a
 * use each time it hands out key material; a key past its expiry or its
 * cap changes state and is never returned again. Ids of deleted keys are
 * retired by the repository and cannot be stored again.
 *
 * All operations are serialized by one mutex; provider round trips happen
 * outside it.
 */
class KeyManager {
public:
    KeyManager(
        std::string owner_id,
        std::unique_ptr<interfaces::IKeyRepository> repository,
        std::shared_ptr<interfaces::IQkdKeyProvider> provider = nullptr,
        configuration::KeyPolicy policy = configuration::KeyPolicy::Default(),
        Clock clock = nullptr);

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    /// Master flow: provision a key shared with @p peer_id, store it, and take its first use
    [[nodiscard]] Result<QuantumKey, QkdFailure> RequestQuantumKey(
        const std::string& peer_id,
        uint32_t key_length_bits = QkdConstants::DEFAULT_KEY_LENGTH_BITS);

    /**
     * @brief Slave flow: obtain the key @p originator_id provisioned under @p key_id
     *
     * An Active local copy is used directly. Without one the provider is
     * asked and the key is stored with role Slave. A local copy that is
     * already consumed or expired is a KeyLifecycleMiss.
     */
    [[nodiscard]] Result<QuantumKey, QkdFailure> RetrieveQuantumKey(
        const std::string& originator_id,
        const std::string& key_id);

    /// Ok(nullopt) for unknown, retired, consumed or expired keys; otherwise counts one use
    [[nodiscard]] Result<std::optional<KeyEntry>, QkdFailure> GetKey(const std::string& key_id);

    /// Ok(false) when @p key_id is already stored or was retired
    [[nodiscard]] Result<bool, QkdFailure> StoreKey(
        const std::string& key_id,
        const std::vector<uint8_t>& key_bytes,
        const KeyMetadata& metadata);

    /// Securely erases the key and retires its id
    [[nodiscard]] Result<bool, QkdFailure> DeleteKey(const std::string& key_id);

    /// Marks expired keys, then securely erases every key no longer Active. Returns the number erased.
    [[nodiscard]] Result<size_t, QkdFailure> CleanupExpiredKeys();

    [[nodiscard]] Result<std::vector<KeySummary>, QkdFailure> ListKeys();

    [[nodiscard]] const std::string& OwnerId() const noexcept { return owner_id_; }
    [[nodiscard]] const configuration::KeyPolicy& Policy() const noexcept { return policy_; }
    [[nodiscard]] bool HasProvider() const noexcept { return provider_ != nullptr; }

private:
    Result<bool, QkdFailure> StoreLocked(
        const std::string& key_id,
        const std::vector<uint8_t>& key_bytes,
        const KeyMetadata& metadata,
        std::chrono::seconds ttl);
    Result<std::optional<KeyEntry>, QkdFailure> GetKeyLocked(const std::string& key_id);
    Result<Unit, QkdFailure> RetireEntry(KeyEntry entry, KeyState state);
    Result<QuantumKey, QkdFailure> TakeFirstUse(const std::string& key_id);
    std::chrono::seconds EffectiveTtl(const interfaces::ProvenanceMetadata& provenance) const;

    std::string owner_id_;
    std::unique_ptr<interfaces::IKeyRepository> repository_;
    std::shared_ptr<interfaces::IQkdKeyProvider> provider_;
    configuration::KeyPolicy policy_;
    Clock clock_;
    std::mutex lock_;
};
}
