#include "qkmail/qkd/bb84_simulator.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/crypto/digest.hpp"
#include "qkmail/core/constants.hpp"
#include "qkmail/core/format.hpp"
#include "qkmail/debug/event_logger.hpp"

#include <cmath>

namespace qkmail::qkd {

using crypto::SodiumInterop;
using crypto::Digest;
using debug::Role;

namespace {

Result<Unit, QkdFailure> ValidateKeyLength(const uint32_t key_length_bits) {
    if (key_length_bits == 0 || key_length_bits % Constants::BITS_PER_BYTE != 0) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::InvalidInput(
                compat::format("Key length must be a positive multiple of 8 bits, got {}", key_length_bits)));
    }
    if (key_length_bits > QkdConstants::MAX_KEY_LENGTH_BITS) {
        return Result<Unit, QkdFailure>::Err(
            QkdFailure::InvalidInput(
                compat::format("Key length {} exceeds maximum {}",
                    key_length_bits, QkdConstants::MAX_KEY_LENGTH_BITS)));
    }
    return Result<Unit, QkdFailure>::Ok(unit);
}

bool IsProbability(const double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

Bb84Simulator::Bb84Simulator(configuration::SimulatorConfig config)
    : config_(config) {}

std::vector<uint8_t> Bb84Simulator::GenerateRandomBits(const size_t count) {
    std::vector<uint8_t> bits(count);
    for (auto& bit : bits) {
        bit = static_cast<uint8_t>(SodiumInterop::RandomUniform(2));
    }
    return bits;
}

std::vector<Basis> Bb84Simulator::GenerateRandomBases(const size_t count) {
    std::vector<Basis> bases(count);
    for (auto& basis : bases) {
        basis = SodiumInterop::RandomUniform(2) == 0 ? Basis::Rectilinear : Basis::Diagonal;
    }
    return bases;
}

Result<ChannelOutcome, QkdFailure> Bb84Simulator::SimulateQuantumChannel(
    std::span<const uint8_t> bits,
    std::span<const Basis> bases,
    const double error_rate) {

    if (!IsProbability(error_rate)) {
        return Result<ChannelOutcome, QkdFailure>::Err(
            QkdFailure::InvalidInput("Channel error rate must be within [0, 1]"));
    }
    if (bits.size() != bases.size()) {
        return Result<ChannelOutcome, QkdFailure>::Err(
            QkdFailure::InvalidInput(
                compat::format("Bit and basis sequences differ in length: {} vs {}",
                    bits.size(), bases.size())));
    }

    const auto flip_threshold = static_cast<uint32_t>(
        std::llround(error_rate * QkdConstants::ERROR_RATE_RESOLUTION));

    ChannelOutcome outcome;
    outcome.receiver_bases = GenerateRandomBases(bits.size());
    outcome.received_bits.reserve(bits.size());

    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] > 1) {
            return Result<ChannelOutcome, QkdFailure>::Err(
                QkdFailure::InvalidInput(compat::format("Bit value at position {} is not 0 or 1", i)));
        }
        if (bases[i] == outcome.receiver_bases[i]) {
            const bool flipped =
                SodiumInterop::RandomUniform(QkdConstants::ERROR_RATE_RESOLUTION) < flip_threshold;
            outcome.received_bits.push_back(flipped ? static_cast<uint8_t>(1 - bits[i]) : bits[i]);
        } else {
            outcome.received_bits.push_back(static_cast<uint8_t>(SodiumInterop::RandomUniform(2)));
        }
    }

    return Result<ChannelOutcome, QkdFailure>::Ok(std::move(outcome));
}

Result<SiftedKey, QkdFailure> Bb84Simulator::SiftKey(
    std::span<const uint8_t> alice_bits,
    std::span<const Basis> alice_bases,
    std::span<const uint8_t> bob_bits,
    std::span<const Basis> bob_bases) {

    const size_t length = alice_bits.size();
    if (alice_bases.size() != length || bob_bits.size() != length || bob_bases.size() != length) {
        return Result<SiftedKey, QkdFailure>::Err(
            QkdFailure::InvalidInput("Sifting requires four sequences of equal length"));
    }

    SiftedKey sifted;
    sifted.alice_bits.reserve(length / 2);
    sifted.bob_bits.reserve(length / 2);
    for (size_t i = 0; i < length; ++i) {
        if (alice_bases[i] == bob_bases[i]) {
            sifted.alice_bits.push_back(alice_bits[i]);
            sifted.bob_bits.push_back(bob_bits[i]);
        }
    }
    return Result<SiftedKey, QkdFailure>::Ok(std::move(sifted));
}

Result<double, QkdFailure> Bb84Simulator::EstimateErrorRate(
    std::span<const uint8_t> alice_sifted,
    std::span<const uint8_t> bob_sifted,
    size_t sample_size) {

    if (alice_sifted.size() != bob_sifted.size()) {
        return Result<double, QkdFailure>::Err(
            QkdFailure::InvalidInput("Sifted keys differ in length"));
    }
    if (alice_sifted.size() < sample_size) {
        sample_size = alice_sifted.size() / 2;
    }
    if (sample_size == 0) {
        return Result<double, QkdFailure>::Ok(0.0);
    }

    size_t errors = 0;
    for (size_t i = 0; i < sample_size; ++i) {
        if (alice_sifted[i] != bob_sifted[i]) {
            ++errors;
        }
    }
    return Result<double, QkdFailure>::Ok(
        static_cast<double>(errors) / static_cast<double>(sample_size));
}

Result<std::vector<uint8_t>, QkdFailure> Bb84Simulator::PrivacyAmplification(
    std::span<const uint8_t> sifted_bits,
    const uint32_t key_length_bits) {

    if (auto valid = ValidateKeyLength(key_length_bits); valid.IsErr()) {
        return Result<std::vector<uint8_t>, QkdFailure>::Err(std::move(valid).UnwrapErr());
    }

    std::vector<uint8_t> rendered;
    rendered.reserve(sifted_bits.size());
    for (const uint8_t bit : sifted_bits) {
        rendered.push_back(bit ? static_cast<uint8_t>('1') : static_cast<uint8_t>('0'));
    }

    auto key = Digest::HashExpand(rendered, key_length_bits / Constants::BITS_PER_BYTE);
    SodiumInterop::Wipe(rendered);
    return key;
}

Result<std::string, QkdFailure> Bb84Simulator::DeriveKeyId(std::span<const uint8_t> key) {
    auto digest = Digest::Sha256(key);
    if (digest.IsErr()) {
        return Result<std::string, QkdFailure>::Err(std::move(digest).UnwrapErr());
    }
    return Result<std::string, QkdFailure>::Ok(
        SodiumInterop::ToHex(digest.Unwrap()).substr(0, QkdConstants::KEY_ID_HEX_LENGTH));
}

Result<GeneratedKey, QkdFailure> Bb84Simulator::GenerateQuantumKey(
    const uint32_t key_length_bits,
    const double channel_error_rate,
    const double error_threshold) const {

    if (auto valid = ValidateKeyLength(key_length_bits); valid.IsErr()) {
        return Result<GeneratedKey, QkdFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (!IsProbability(error_threshold)) {
        return Result<GeneratedKey, QkdFailure>::Err(
            QkdFailure::InvalidInput("QBER threshold must be within [0, 1]"));
    }

    QKM_LOG_SECTION(Role::Local, "BB84 exchange");
    const size_t transmission_length =
        static_cast<size_t>(key_length_bits) * config_.OversamplingFactor();
    QKM_LOG_VALUE(Role::Local, "bb84", "transmission_length", transmission_length);

    const auto alice_bits = GenerateRandomBits(transmission_length);
    const auto alice_bases = GenerateRandomBases(transmission_length);

    auto channel = SimulateQuantumChannel(alice_bits, alice_bases, channel_error_rate);
    if (channel.IsErr()) {
        return Result<GeneratedKey, QkdFailure>::Err(std::move(channel).UnwrapErr());
    }
    const ChannelOutcome& received = channel.Unwrap();

    auto sift = SiftKey(alice_bits, alice_bases, received.received_bits, received.receiver_bases);
    if (sift.IsErr()) {
        return Result<GeneratedKey, QkdFailure>::Err(std::move(sift).UnwrapErr());
    }
    SiftedKey& sifted = sift.Unwrap();
    QKM_LOG_VALUE(Role::Local, "bb84", "sifted_length", sifted.alice_bits.size());

    auto qber_result = EstimateErrorRate(sifted.alice_bits, sifted.bob_bits, config_.QberSampleSize());
    if (qber_result.IsErr()) {
        return Result<GeneratedKey, QkdFailure>::Err(std::move(qber_result).UnwrapErr());
    }
    const double qber = qber_result.Unwrap();
    QKM_LOG_VALUE(Role::Local, "bb84", "qber", qber);

    if (qber > error_threshold) {
        SodiumInterop::Wipe(sifted.alice_bits);
        SodiumInterop::Wipe(sifted.bob_bits);
        return Result<GeneratedKey, QkdFailure>::Err(
            QkdFailure::EavesdroppingDetected(
                compat::format("QBER too high: {:.2f}% > {:.2f}%. Possible eavesdropping",
                    qber * 100.0, error_threshold * 100.0)));
    }

    auto amplified = PrivacyAmplification(sifted.alice_bits, key_length_bits);
    SodiumInterop::Wipe(sifted.alice_bits);
    SodiumInterop::Wipe(sifted.bob_bits);
    if (amplified.IsErr()) {
        return Result<GeneratedKey, QkdFailure>::Err(std::move(amplified).UnwrapErr());
    }

    GeneratedKey generated;
    generated.key_bytes = std::move(amplified).Unwrap();
    auto key_id = DeriveKeyId(generated.key_bytes);
    if (key_id.IsErr()) {
        SodiumInterop::Wipe(generated.key_bytes);
        return Result<GeneratedKey, QkdFailure>::Err(std::move(key_id).UnwrapErr());
    }
    generated.key_id = std::move(key_id).Unwrap();
    QKM_LOG_KEY(Role::Local, "bb84", generated.key_id, std::span<const uint8_t>(generated.key_bytes));

    return Result<GeneratedKey, QkdFailure>::Ok(std::move(generated));
}

Result<GeneratedKey, QkdFailure> Bb84Simulator::GenerateQuantumKey(const uint32_t key_length_bits) const {
    return GenerateQuantumKey(key_length_bits, config_.ChannelErrorRate(), config_.ErrorThreshold());
}

Result<GeneratedKey, QkdFailure> Bb84Simulator::GenerateQuantumKey() const {
    return GenerateQuantumKey(config_.DefaultKeyLengthBits());
}

} // namespace qkmail::qkd
