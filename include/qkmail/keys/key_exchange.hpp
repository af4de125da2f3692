#pragma once
#include "qkmail/keys/key_manager.hpp"
#include "qkmail/qkd/local_key_channel.hpp"
#include <memory>
#include <optional>
namespace qkmail::keys {

/**
 * @brief Pre-shares a simulated BB84 key between two key managers
 *
 * The initiator stores the key as Master and the responder as Slave, each
 * with the other party as peer. If the responder cannot take the key the
 * initiator's copy is erased again.
 */
class KeyExchange {
public:
    explicit KeyExchange(std::shared_ptr<qkd::LocalKeyChannel> channel);

    /// Returns the shared key id
    [[nodiscard]] Result<std::string, QkdFailure> EstablishSharedKey(
        KeyManager& initiator,
        KeyManager& responder,
        std::optional<uint32_t> key_length_bits = std::nullopt);

private:
    std::shared_ptr<qkd::LocalKeyChannel> channel_;
};
}
