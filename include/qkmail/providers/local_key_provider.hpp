#pragma once
#include "qkmail/interfaces/i_qkd_key_provider.hpp"
#include "qkmail/qkd/local_key_channel.hpp"
#include <memory>
namespace qkmail::providers {

/// Provider backed by a simulated BB84 link shared with the peer
class LocalKeyProvider final : public interfaces::IQkdKeyProvider {
public:
    explicit LocalKeyProvider(std::shared_ptr<qkd::LocalKeyChannel> channel);

    [[nodiscard]] Result<interfaces::ProvisionedKey, QkdFailure> RequestKey(
        const std::string& sender_id,
        const std::string& receiver_id,
        uint32_t size_bits) override;

    /// An unknown id surfaces as KeyLifecycleMiss
    [[nodiscard]] Result<interfaces::ProvisionedKey, QkdFailure> RetrieveKey(
        const std::string& originator_id,
        const std::string& key_id) override;

private:
    std::shared_ptr<qkd::LocalKeyChannel> channel_;
};
}
