#pragma once
#include "qkmail/interfaces/i_key_repository.hpp"
#include <unordered_map>
#include <unordered_set>
namespace qkmail::keys {

/// Volatile key table; erasing wipes the key bytes before dropping the entry and retires the id
class InMemoryKeyRepository final : public interfaces::IKeyRepository {
public:
    InMemoryKeyRepository() = default;
    ~InMemoryKeyRepository() override;

    InMemoryKeyRepository(const InMemoryKeyRepository&) = delete;
    InMemoryKeyRepository& operator=(const InMemoryKeyRepository&) = delete;

    [[nodiscard]] Result<bool, QkdFailure> Insert(const KeyEntry& entry) override;
    [[nodiscard]] Result<std::optional<KeyEntry>, QkdFailure> Find(const std::string& key_id) override;
    [[nodiscard]] Result<Unit, QkdFailure> Update(const KeyEntry& entry) override;
    [[nodiscard]] Result<bool, QkdFailure> SecureErase(const std::string& key_id) override;
    [[nodiscard]] Result<bool, QkdFailure> IsRetired(const std::string& key_id) override;
    [[nodiscard]] Result<std::vector<std::string>, QkdFailure> ListKeyIds() override;

private:
    std::unordered_map<std::string, KeyEntry> entries_;
    std::unordered_set<std::string> retired_ids_;
};
}
