#pragma once

#include "qkmail/core/constants.hpp"

#include <cstdint>

namespace qkmail::configuration {

/// Parameters of a simulated BB84 exchange
///
/// Immutable once built. The key length used by a single exchange is always
/// passed per call; `DefaultKeyLengthBits()` only fills in when the caller
/// does not specify one.
///
/// @example
/// ```cpp
/// // Ideal channel, 256-bit keys, 11% QBER abort threshold
/// auto config = SimulatorConfig::Default();
///
/// // 5% bit-flip rate on matching bases
/// auto noisy = SimulatorConfig::Noisy(0.05);
/// ```
class SimulatorConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr SimulatorConfig Default() noexcept {
        return SimulatorConfig(
            QkdConstants::DEFAULT_KEY_LENGTH_BITS,
            QkdConstants::OVERSAMPLING_FACTOR,
            QkdConstants::QBER_SAMPLE_SIZE,
            QkdConstants::QBER_THRESHOLD,
            0.0);
    }

    /// Channel that flips each basis-matched bit with the given probability
    [[nodiscard]] static constexpr SimulatorConfig Noisy(const double channel_error_rate) noexcept {
        SimulatorConfig config = Default();
        config.channel_error_rate_ = channel_error_rate;
        return config;
    }

    [[nodiscard]] constexpr SimulatorConfig WithDefaultKeyLength(const uint32_t bits) const noexcept {
        SimulatorConfig copy = *this;
        copy.default_key_length_bits_ = bits;
        return copy;
    }

    [[nodiscard]] constexpr SimulatorConfig WithErrorThreshold(const double threshold) const noexcept {
        SimulatorConfig copy = *this;
        copy.error_threshold_ = threshold;
        return copy;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr uint32_t DefaultKeyLengthBits() const noexcept {
        return default_key_length_bits_;
    }

    /// Transmitted positions per requested key bit
    [[nodiscard]] constexpr uint32_t OversamplingFactor() const noexcept {
        return oversampling_factor_;
    }

    [[nodiscard]] constexpr size_t QberSampleSize() const noexcept {
        return qber_sample_size_;
    }

    [[nodiscard]] constexpr double ErrorThreshold() const noexcept {
        return error_threshold_;
    }

    [[nodiscard]] constexpr double ChannelErrorRate() const noexcept {
        return channel_error_rate_;
    }

private:
    constexpr SimulatorConfig(
        const uint32_t default_key_length_bits,
        const uint32_t oversampling_factor,
        const size_t qber_sample_size,
        const double error_threshold,
        const double channel_error_rate) noexcept
        : default_key_length_bits_(default_key_length_bits)
        , oversampling_factor_(oversampling_factor)
        , qber_sample_size_(qber_sample_size)
        , error_threshold_(error_threshold)
        , channel_error_rate_(channel_error_rate) {}

    uint32_t default_key_length_bits_;
    uint32_t oversampling_factor_;
    size_t qber_sample_size_;
    double error_threshold_;
    double channel_error_rate_;
};

} // namespace qkmail::configuration
