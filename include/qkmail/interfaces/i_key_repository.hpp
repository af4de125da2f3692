#pragma once
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/keys/key_entry.hpp"
#include <optional>
#include <string>
#include <vector>
namespace qkmail::interfaces {

/**
 * Persistence for one party's key table.
 *
 * Not thread-safe on its own; KeyManager serializes every call.
 * SecureErase must destroy the persisted key material before the entry
 * disappears (overwrite, then remove) and retire the id: a retired id is
 * never inserted again, and persistent stores keep it retired across reopen.
 */
class IKeyRepository {
public:
    virtual ~IKeyRepository() = default;
    /// Ok(false) if the id is already present or retired
    [[nodiscard]] virtual Result<bool, QkdFailure> Insert(const keys::KeyEntry& entry) = 0;
    [[nodiscard]] virtual Result<std::optional<keys::KeyEntry>, QkdFailure> Find(
        const std::string& key_id) = 0;
    [[nodiscard]] virtual Result<Unit, QkdFailure> Update(const keys::KeyEntry& entry) = 0;
    /// Ok(false) if the id is unknown
    [[nodiscard]] virtual Result<bool, QkdFailure> SecureErase(const std::string& key_id) = 0;
    [[nodiscard]] virtual Result<bool, QkdFailure> IsRetired(const std::string& key_id) = 0;
    [[nodiscard]] virtual Result<std::vector<std::string>, QkdFailure> ListKeyIds() = 0;
};
}
