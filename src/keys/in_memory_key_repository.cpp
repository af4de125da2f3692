#include "qkmail/keys/in_memory_key_repository.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/format.hpp"
#include <algorithm>
namespace qkmail::keys {
using crypto::SodiumInterop;
InMemoryKeyRepository::~InMemoryKeyRepository() {
    for (auto& [key_id, entry] : entries_) {
        SodiumInterop::Wipe(entry.key_bytes);
    }
}
Result<bool, QkdFailure> InMemoryKeyRepository::Insert(const KeyEntry& entry) {
    if (retired_ids_.contains(entry.key_id)) {
        return Result<bool, QkdFailure>::Ok(false);
    }
    const auto [it, inserted] = entries_.try_emplace(entry.key_id, entry);
    return Result<bool, QkdFailure>::Ok(inserted);
}
Result<std::optional<KeyEntry>, QkdFailure> InMemoryKeyRepository::Find(const std::string& key_id) {
    const auto it = entries_.find(key_id);
    if (it == entries_.end()) {
        return Result<std::optional<KeyEntry>, QkdFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<KeyEntry>, QkdFailure>::Ok(it->second);
}
Result<Unit, QkdFailure> InMemoryKeyRepository::Update(const KeyEntry& entry) {
    const auto it = entries_.find(entry.key_id);
    if (it == entries_.end()) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::KeyNotFound(compat::format("Cannot update unknown key {}", entry.key_id)));
    }
    SodiumInterop::Wipe(it->second.key_bytes);
    it->second = entry;
    return Result<Unit, QkdFailure>::Ok(unit);
}
Result<bool, QkdFailure> InMemoryKeyRepository::SecureErase(const std::string& key_id) {
    const auto it = entries_.find(key_id);
    if (it == entries_.end()) {
        return Result<bool, QkdFailure>::Ok(false);
    }
    SodiumInterop::Wipe(it->second.key_bytes);
    entries_.erase(it);
    retired_ids_.insert(key_id);
    return Result<bool, QkdFailure>::Ok(true);
}
Result<bool, QkdFailure> InMemoryKeyRepository::IsRetired(const std::string& key_id) {
    return Result<bool, QkdFailure>::Ok(retired_ids_.contains(key_id));
}
Result<std::vector<std::string>, QkdFailure> InMemoryKeyRepository::ListKeyIds() {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [key_id, entry] : entries_) {
        ids.push_back(key_id);
    }
    std::sort(ids.begin(), ids.end());
    return Result<std::vector<std::string>, QkdFailure>::Ok(std::move(ids));
}
}
