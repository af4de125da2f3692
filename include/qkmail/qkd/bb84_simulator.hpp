#pragma once

#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include "qkmail/configuration/simulator_config.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace qkmail::qkd {

enum class Basis : uint8_t {
    Rectilinear = 0,
    Diagonal = 1
};

struct ChannelOutcome {
    std::vector<uint8_t> received_bits;
    std::vector<Basis> receiver_bases;
};

struct SiftedKey {
    std::vector<uint8_t> alice_bits;
    std::vector<uint8_t> bob_bits;
};

struct GeneratedKey {
    std::vector<uint8_t> key_bytes;
    std::string key_id;
};

/**
 * @brief Logical BB84 key exchange
 *
 * Models the exchange at the bit/basis level only: random preparation,
 * measurement in random bases, basis reconciliation, QBER estimation over a
 * disclosed prefix and SHA-256 privacy amplification. All randomness comes
 * from libsodium's CSPRNG; SodiumInterop::Initialize() must have succeeded.
 *
 * Bits are represented as bytes holding 0 or 1.
 */
class Bb84Simulator {
public:
    explicit Bb84Simulator(configuration::SimulatorConfig config = configuration::SimulatorConfig::Default());

    [[nodiscard]] const configuration::SimulatorConfig& Config() const noexcept { return config_; }

    static std::vector<uint8_t> GenerateRandomBits(size_t count);
    static std::vector<Basis> GenerateRandomBases(size_t count);

    /**
     * @brief Receiver side of the quantum channel
     *
     * The receiver draws its own bases. On a basis match the bit arrives
     * intact except with probability @p error_rate; on a mismatch the
     * measured bit is uniformly random.
     */
    static Result<ChannelOutcome, QkdFailure> SimulateQuantumChannel(
        std::span<const uint8_t> bits,
        std::span<const Basis> bases,
        double error_rate);

    /// Keep the positions where both parties used the same basis
    static Result<SiftedKey, QkdFailure> SiftKey(
        std::span<const uint8_t> alice_bits,
        std::span<const Basis> alice_bases,
        std::span<const uint8_t> bob_bits,
        std::span<const Basis> bob_bases);

    /**
     * @brief QBER over the first @p sample_size sifted positions
     *
     * A sifted key shorter than the sample shrinks the sample to half its
     * length. An empty sample reports 0.
     */
    static Result<double, QkdFailure> EstimateErrorRate(
        std::span<const uint8_t> alice_sifted,
        std::span<const uint8_t> bob_sifted,
        size_t sample_size);

    /// SHA-256 chain over the ASCII '0'/'1' rendering of the sifted bits
    static Result<std::vector<uint8_t>, QkdFailure> PrivacyAmplification(
        std::span<const uint8_t> sifted_bits,
        uint32_t key_length_bits);

    /// First 16 hex characters of SHA-256(key)
    static Result<std::string, QkdFailure> DeriveKeyId(std::span<const uint8_t> key);

    /**
     * @brief Full exchange producing @p key_length_bits of key material
     *
     * Fails with EavesdroppingDetected when the estimated QBER exceeds
     * @p error_threshold; a degraded key is never returned.
     */
    [[nodiscard]] Result<GeneratedKey, QkdFailure> GenerateQuantumKey(
        uint32_t key_length_bits,
        double channel_error_rate,
        double error_threshold) const;

    /// Uses the configured channel error rate and threshold
    [[nodiscard]] Result<GeneratedKey, QkdFailure> GenerateQuantumKey(uint32_t key_length_bits) const;

    [[nodiscard]] Result<GeneratedKey, QkdFailure> GenerateQuantumKey() const;

private:
    configuration::SimulatorConfig config_;
};

} // namespace qkmail::qkd
