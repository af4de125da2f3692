#pragma once

#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/qkd/bb84_simulator.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace qkmail::qkd {

/**
 * @brief In-process stand-in for a QKD link between two parties
 *
 * Keys produced by the simulator are held by key_id until the receiving side
 * has taken delivery and calls Remove. A sender-side and a receiver-side provider may share one channel from
 * different threads.
 */
class LocalKeyChannel {
public:
    explicit LocalKeyChannel(
        configuration::SimulatorConfig config = configuration::SimulatorConfig::Default());

    ~LocalKeyChannel();

    LocalKeyChannel(const LocalKeyChannel&) = delete;
    LocalKeyChannel& operator=(const LocalKeyChannel&) = delete;

    /**
     * @brief Run one BB84 exchange and record the result for both parties
     *
     * @param key_length_bits Overrides the simulator default for this call only
     */
    [[nodiscard]] Result<GeneratedKey, QkdFailure> EstablishKeyPair(
        const std::string& party_a,
        const std::string& party_b,
        std::optional<uint32_t> key_length_bits = std::nullopt);

    /// KeyNotFound for an id this channel never produced
    [[nodiscard]] Result<std::vector<uint8_t>, QkdFailure> GetKey(const std::string& key_id) const;

    /// Wipes and drops the channel copy; false if @p key_id is not held
    bool Remove(const std::string& key_id);

    [[nodiscard]] size_t Size() const;

private:
    struct ChannelRecord {
        std::vector<uint8_t> key;
        std::string party_a;
        std::string party_b;
    };

    Bb84Simulator simulator_;
    mutable std::mutex lock_;
    std::unordered_map<std::string, ChannelRecord> key_store_;
};

} // namespace qkmail::qkd
