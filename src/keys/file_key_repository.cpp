#include "qkmail/keys/file_key_repository.hpp"
#include "qkmail/keys/key_id.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/core/format.hpp"
#include "qkmail/debug/event_logger.hpp"
#include "storage/key_record.pb.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
namespace qkmail::keys {
using crypto::SodiumInterop;
using debug::Role;
namespace fs = std::filesystem;
namespace {
    int64_t ToUnixMillis(const TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    TimePoint FromUnixMillis(const int64_t ms) {
        return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
    }

    proto::storage::KeyState ToProtoState(const KeyState state) {
        switch (state) {
            case KeyState::Active: return proto::storage::KEY_STATE_ACTIVE;
            case KeyState::Consumed: return proto::storage::KEY_STATE_CONSUMED;
            case KeyState::Expired: return proto::storage::KEY_STATE_EXPIRED;
        }
        return proto::storage::KEY_STATE_EXPIRED;
    }

    Result<KeyState, QkdFailure> FromProtoState(const proto::storage::KeyState state) {
        switch (state) {
            case proto::storage::KEY_STATE_ACTIVE:
                return Result<KeyState, QkdFailure>::Ok(KeyState::Active);
            case proto::storage::KEY_STATE_CONSUMED:
                return Result<KeyState, QkdFailure>::Ok(KeyState::Consumed);
            case proto::storage::KEY_STATE_EXPIRED:
                return Result<KeyState, QkdFailure>::Ok(KeyState::Expired);
            default:
                return Result<KeyState, QkdFailure>::Err(
                    QkdFailure::Storage(compat::format("Unknown key state {}", static_cast<int>(state))));
        }
    }

    proto::storage::KeyRecord ToRecord(const KeyEntry& entry) {
        proto::storage::KeyRecord record;
        record.set_key_id(entry.key_id);
        record.set_key_bytes(entry.key_bytes.data(), entry.key_bytes.size());
        record.set_created_at_unix_ms(ToUnixMillis(entry.created_at));
        record.set_expires_at_unix_ms(ToUnixMillis(entry.expires_at));
        record.set_usage_count(entry.usage_count);
        if (entry.max_usage) {
            record.set_max_usage(*entry.max_usage);
        }
        record.set_state(ToProtoState(entry.state));
        record.set_peer_id(entry.metadata.peer_id);
        record.set_role(entry.metadata.role == KeyRole::Master
            ? proto::storage::KEY_ROLE_MASTER
            : proto::storage::KEY_ROLE_SLAVE);
        record.set_provenance(entry.metadata.provenance);
        record.set_purpose(entry.metadata.purpose);
        record.set_key_length_bits(entry.metadata.key_length_bits);
        return record;
    }

    Result<KeyEntry, QkdFailure> FromRecord(const proto::storage::KeyRecord& record) {
        auto state = FromProtoState(record.state());
        if (state.IsErr()) {
            return Result<KeyEntry, QkdFailure>::Err(std::move(state).UnwrapErr());
        }
        KeyEntry entry;
        entry.key_id = record.key_id();
        entry.key_bytes.assign(record.key_bytes().begin(), record.key_bytes().end());
        entry.created_at = FromUnixMillis(record.created_at_unix_ms());
        entry.expires_at = FromUnixMillis(record.expires_at_unix_ms());
        entry.usage_count = record.usage_count();
        if (record.has_max_usage()) {
            entry.max_usage = record.max_usage();
        }
        entry.state = state.Unwrap();
        entry.metadata.peer_id = record.peer_id();
        entry.metadata.role = record.role() == proto::storage::KEY_ROLE_SLAVE ? KeyRole::Slave : KeyRole::Master;
        entry.metadata.provenance = record.provenance();
        entry.metadata.purpose = record.purpose();
        entry.metadata.key_length_bits = record.key_length_bits();
        return Result<KeyEntry, QkdFailure>::Ok(std::move(entry));
    }

    void WipeString(std::string& buffer) {
        SodiumInterop::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(buffer.data()), buffer.size()));
    }

    /// Overwrites the inode behind @p path with random bytes; a missing file is left alone
    Result<Unit, QkdFailure> OverwriteInPlace(const fs::path& path) {
        std::error_code ec;
        const auto file_size = fs::file_size(path, ec);
        if (ec) {
            return Result<Unit, QkdFailure>::Ok(unit);
        }
        const size_t overwrite_size = std::max(
            static_cast<size_t>(file_size), KeyPolicyConstants::SECURE_OVERWRITE_MIN_BYTES);
        auto noise = SodiumInterop::GetRandomBytes(overwrite_size);
        std::fstream out(path, std::ios::binary | std::ios::in | std::ios::out);
        out.seekp(0);
        out.write(reinterpret_cast<const char*>(noise.data()), static_cast<std::streamsize>(noise.size()));
        out.flush();
        if (!out) {
            return Result<Unit, QkdFailure>::Err(
                QkdFailure::Storage(compat::format("Failed to overwrite key file {}", path.string())));
        }
        return Result<Unit, QkdFailure>::Ok(unit);
    }

    /**
     * Writes @p contents to a sibling temporary file and renames it over @p target.
     * The previous target is overwritten in place first, so key bytes do not
     * survive in the old inode. @p contents is wiped on every path.
     */
    Result<Unit, QkdFailure> ReplaceFile(const fs::path& target, std::string& contents) {
        fs::path temporary = target;
        temporary += ".tmp";
        {
            std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
            out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
            out.flush();
            WipeString(contents);
            if (!out) {
                std::error_code ignored;
                fs::remove(temporary, ignored);
                return Result<Unit, QkdFailure>::Err(
                    QkdFailure::Storage(compat::format("Failed to write key file {}", temporary.string())));
            }
        }
        if (auto scrubbed = OverwriteInPlace(target); scrubbed.IsErr()) {
            std::error_code ignored;
            fs::remove(temporary, ignored);
            return scrubbed;
        }
        std::error_code ec;
        fs::rename(temporary, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temporary, ignored);
            return Result<Unit, QkdFailure>::Err(
                QkdFailure::Storage(compat::format("Failed to move key file into place {}: {}",
                    target.string(), ec.message())));
        }
        return Result<Unit, QkdFailure>::Ok(unit);
    }
}
FileKeyRepository::FileKeyRepository(fs::path directory)
    : directory_(std::move(directory)) {}
FileKeyRepository::~FileKeyRepository() {
    for (auto& [key_id, entry] : cache_) {
        SodiumInterop::Wipe(entry.key_bytes);
    }
}
Result<std::unique_ptr<FileKeyRepository>, QkdFailure> FileKeyRepository::Open(const fs::path& directory) {
    if (directory.empty()) {
        return Result<std::unique_ptr<FileKeyRepository>, QkdFailure>::Err(
            QkdFailure::InvalidInput("Key storage directory is empty"));
    }
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Result<std::unique_ptr<FileKeyRepository>, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Cannot create key storage directory {}: {}",
                directory.string(), ec.message())));
    }
    std::unique_ptr<FileKeyRepository> repository(new FileKeyRepository(directory));
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const fs::path& path = it->path();
        if (path.extension() != KeyPolicyConstants::KEY_FILE_EXTENSION) {
            continue;
        }
        std::string key_id = path.stem().string();
        if (ValidateKeyId(key_id).IsErr()) {
            QKM_LOG_EVENT(Role::Local, "storage", "skipping foreign file " + path.filename().string());
            continue;
        }
        repository->known_ids_.insert(std::move(key_id));
    }
    if (ec) {
        return Result<std::unique_ptr<FileKeyRepository>, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Cannot scan key storage directory {}: {}",
                directory.string(), ec.message())));
    }
    if (auto loaded = repository->LoadRetiredIndex(); loaded.IsErr()) {
        return Result<std::unique_ptr<FileKeyRepository>, QkdFailure>::Err(std::move(loaded).UnwrapErr());
    }
    QKM_LOG_VALUE(Role::Local, "storage", "indexed_keys", repository->known_ids_.size());
    QKM_LOG_VALUE(Role::Local, "storage", "retired_keys", repository->retired_ids_.size());
    return Result<std::unique_ptr<FileKeyRepository>, QkdFailure>::Ok(std::move(repository));
}
fs::path FileKeyRepository::PathFor(const std::string& key_id) const {
    return directory_ / (key_id + std::string(KeyPolicyConstants::KEY_FILE_EXTENSION));
}
fs::path FileKeyRepository::RetiredIndexPath() const {
    return directory_ / std::string(KeyPolicyConstants::RETIRED_INDEX_FILE);
}
Result<Unit, QkdFailure> FileKeyRepository::WriteRecord(const KeyEntry& entry) {
    if (auto valid = ValidateKeyId(entry.key_id); valid.IsErr()) {
        return valid;
    }
    std::string serialized;
    auto record = ToRecord(entry);
    const bool encoded = record.SerializeToString(&serialized);
    WipeString(*record.mutable_key_bytes());
    if (!encoded) {
        WipeString(serialized);
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::Encode(compat::format("Failed to serialize key record {}", entry.key_id)));
    }
    return ReplaceFile(PathFor(entry.key_id), serialized);
}
Result<Unit, QkdFailure> FileKeyRepository::LoadRetiredIndex() {
    const fs::path path = RetiredIndexPath();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Unit, QkdFailure>::Ok(unit);
    }
    std::ifstream in(path, std::ios::binary);
    proto::storage::RetiredKeyIndex index;
    if (!in || !index.ParseFromIstream(&in)) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Corrupt retired key index {}", path.string())));
    }
    for (const std::string& key_id : index.key_ids()) {
        retired_ids_.insert(key_id);
    }
    return Result<Unit, QkdFailure>::Ok(unit);
}
Result<Unit, QkdFailure> FileKeyRepository::WriteRetiredIndex() {
    proto::storage::RetiredKeyIndex index;
    for (const std::string& key_id : retired_ids_) {
        index.add_key_ids(key_id);
    }
    std::string serialized;
    if (!index.SerializeToString(&serialized)) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::Encode("Failed to serialize retired key index"));
    }
    return ReplaceFile(RetiredIndexPath(), serialized);
}
Result<KeyEntry, QkdFailure> FileKeyRepository::ReadRecord(const std::string& key_id) const {
    const fs::path path = PathFor(key_id);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<KeyEntry, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Cannot open key file {}", path.string())));
    }
    std::string serialized((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        WipeString(serialized);
        return Result<KeyEntry, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Cannot read key file {}", path.string())));
    }
    proto::storage::KeyRecord record;
    const bool parsed = record.ParseFromString(serialized);
    WipeString(serialized);
    if (!parsed) {
        return Result<KeyEntry, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Corrupt key file {}", path.string())));
    }
    if (record.key_id() != key_id) {
        WipeString(*record.mutable_key_bytes());
        return Result<KeyEntry, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Key file {} holds key id {}", path.string(), record.key_id())));
    }
    auto entry = FromRecord(record);
    WipeString(*record.mutable_key_bytes());
    return entry;
}
void FileKeyRepository::EvictCached(const std::string& key_id) {
    const auto it = cache_.find(key_id);
    if (it != cache_.end()) {
        SodiumInterop::Wipe(it->second.key_bytes);
        cache_.erase(it);
    }
}
Result<bool, QkdFailure> FileKeyRepository::Insert(const KeyEntry& entry) {
    if (known_ids_.contains(entry.key_id) || retired_ids_.contains(entry.key_id)) {
        return Result<bool, QkdFailure>::Ok(false);
    }
    auto written = WriteRecord(entry);
    if (written.IsErr()) {
        return Result<bool, QkdFailure>::Err(std::move(written).UnwrapErr());
    }
    known_ids_.insert(entry.key_id);
    cache_.insert_or_assign(entry.key_id, entry);
    return Result<bool, QkdFailure>::Ok(true);
}
Result<std::optional<KeyEntry>, QkdFailure> FileKeyRepository::Find(const std::string& key_id) {
    if (!known_ids_.contains(key_id)) {
        return Result<std::optional<KeyEntry>, QkdFailure>::Ok(std::nullopt);
    }
    if (const auto it = cache_.find(key_id); it != cache_.end()) {
        return Result<std::optional<KeyEntry>, QkdFailure>::Ok(it->second);
    }
    auto loaded = ReadRecord(key_id);
    if (loaded.IsErr()) {
        return Result<std::optional<KeyEntry>, QkdFailure>::Err(std::move(loaded).UnwrapErr());
    }
    const auto [it, inserted] = cache_.insert_or_assign(key_id, std::move(loaded).Unwrap());
    return Result<std::optional<KeyEntry>, QkdFailure>::Ok(it->second);
}
Result<Unit, QkdFailure> FileKeyRepository::Update(const KeyEntry& entry) {
    if (!known_ids_.contains(entry.key_id)) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::KeyNotFound(compat::format("Cannot update unknown key {}", entry.key_id)));
    }
    auto written = WriteRecord(entry);
    if (written.IsErr()) {
        EvictCached(entry.key_id);
        return written;
    }
    EvictCached(entry.key_id);
    cache_.emplace(entry.key_id, entry);
    return Result<Unit, QkdFailure>::Ok(unit);
}
Result<bool, QkdFailure> FileKeyRepository::SecureErase(const std::string& key_id) {
    if (!known_ids_.contains(key_id)) {
        return Result<bool, QkdFailure>::Ok(false);
    }
    EvictCached(key_id);

    if (!retired_ids_.contains(key_id)) {
        retired_ids_.insert(key_id);
        if (auto persisted = WriteRetiredIndex(); persisted.IsErr()) {
            retired_ids_.erase(key_id);
            return Result<bool, QkdFailure>::Err(std::move(persisted).UnwrapErr());
        }
    }
    const fs::path path = PathFor(key_id);
    if (auto scrubbed = OverwriteInPlace(path); scrubbed.IsErr()) {
        return Result<bool, QkdFailure>::Err(std::move(scrubbed).UnwrapErr());
    }
    std::error_code ec;
    if (!fs::remove(path, ec) && ec) {
        return Result<bool, QkdFailure>::Err(
            QkdFailure::Storage(compat::format("Failed to remove key file {}: {}", path.string(), ec.message())));
    }
    known_ids_.erase(key_id);
    QKM_LOG_EVENT(Role::Local, "storage", "securely erased " + key_id);
    return Result<bool, QkdFailure>::Ok(true);
}
Result<bool, QkdFailure> FileKeyRepository::IsRetired(const std::string& key_id) {
    return Result<bool, QkdFailure>::Ok(retired_ids_.contains(key_id));
}
Result<std::vector<std::string>, QkdFailure> FileKeyRepository::ListKeyIds() {
    return Result<std::vector<std::string>, QkdFailure>::Ok(
        std::vector<std::string>(known_ids_.begin(), known_ids_.end()));
}
}
