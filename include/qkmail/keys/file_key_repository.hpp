#pragma once
#include "qkmail/interfaces/i_key_repository.hpp"
#include <filesystem>
#include <memory>
#include <set>
#include <unordered_map>
namespace qkmail::keys {

/**
 * @brief Key table persisted as one protobuf KeyRecord file per key
 *
 * Layout: <directory>/<key_id>.key, plus <directory>/.retired listing erased
 * ids. Records are written to a temporary file and renamed into place after
 * the previous file has been overwritten in place. Entries are loaded on
 * first access and cached. SecureErase records the id in .retired, overwrites
 * the file with random bytes (at least 1 KiB), flushes it, then removes it.
 */
class FileKeyRepository final : public interfaces::IKeyRepository {
public:
    /// Creates @p directory if needed and indexes the *.key files and retired ids already present
    [[nodiscard]] static Result<std::unique_ptr<FileKeyRepository>, QkdFailure> Open(
        const std::filesystem::path& directory);

    ~FileKeyRepository() override;

    FileKeyRepository(const FileKeyRepository&) = delete;
    FileKeyRepository& operator=(const FileKeyRepository&) = delete;

    [[nodiscard]] Result<bool, QkdFailure> Insert(const KeyEntry& entry) override;
    [[nodiscard]] Result<std::optional<KeyEntry>, QkdFailure> Find(const std::string& key_id) override;
    [[nodiscard]] Result<Unit, QkdFailure> Update(const KeyEntry& entry) override;
    [[nodiscard]] Result<bool, QkdFailure> SecureErase(const std::string& key_id) override;
    [[nodiscard]] Result<bool, QkdFailure> IsRetired(const std::string& key_id) override;
    [[nodiscard]] Result<std::vector<std::string>, QkdFailure> ListKeyIds() override;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }
    [[nodiscard]] std::filesystem::path PathFor(const std::string& key_id) const;

private:
    explicit FileKeyRepository(std::filesystem::path directory);

    Result<Unit, QkdFailure> WriteRecord(const KeyEntry& entry);
    Result<KeyEntry, QkdFailure> ReadRecord(const std::string& key_id) const;
    Result<Unit, QkdFailure> LoadRetiredIndex();
    Result<Unit, QkdFailure> WriteRetiredIndex();
    std::filesystem::path RetiredIndexPath() const;
    void EvictCached(const std::string& key_id);

    std::filesystem::path directory_;
    std::set<std::string> known_ids_;
    std::set<std::string> retired_ids_;
    std::unordered_map<std::string, KeyEntry> cache_;
};
}
