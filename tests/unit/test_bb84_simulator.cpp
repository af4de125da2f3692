#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "qkmail/qkd/bb84_simulator.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "qkmail/crypto/digest.hpp"
#include <string>
using namespace qkmail;
using namespace qkmail::qkd;
using configuration::SimulatorConfig;
using crypto::SodiumInterop;
TEST_CASE("Bb84Simulator - Random sources", "[bb84]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bits = Bb84Simulator::GenerateRandomBits(512);
    auto bases = Bb84Simulator::GenerateRandomBases(512);
    REQUIRE(bits.size() == 512);
    REQUIRE(bases.size() == 512);
    size_t ones = 0;
    for (const auto bit : bits) {
        REQUIRE(bit <= 1);
        ones += bit;
    }
    REQUIRE(ones > 0);
    REQUIRE(ones < 512);
}
TEST_CASE("Bb84Simulator - Quantum channel", "[bb84]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bits = Bb84Simulator::GenerateRandomBits(1000);
    auto bases = Bb84Simulator::GenerateRandomBases(1000);
    SECTION("Noiseless channel preserves bits where bases match") {
        auto outcome = Bb84Simulator::SimulateQuantumChannel(bits, bases, 0.0);
        REQUIRE(outcome.IsOk());
        const auto& received = outcome.Unwrap();
        REQUIRE(received.received_bits.size() == bits.size());
        for (size_t i = 0; i < bits.size(); ++i) {
            if (received.receiver_bases[i] == bases[i]) {
                REQUIRE(received.received_bits[i] == bits[i]);
            }
        }
    }
    SECTION("Full error rate flips every matched bit") {
        auto outcome = Bb84Simulator::SimulateQuantumChannel(bits, bases, 1.0);
        REQUIRE(outcome.IsOk());
        const auto& received = outcome.Unwrap();
        for (size_t i = 0; i < bits.size(); ++i) {
            if (received.receiver_bases[i] == bases[i]) {
                REQUIRE(received.received_bits[i] != bits[i]);
            }
        }
    }
    SECTION("Invalid inputs") {
        REQUIRE(Bb84Simulator::SimulateQuantumChannel(bits, bases, 1.5).IsErr());
        REQUIRE(Bb84Simulator::SimulateQuantumChannel(bits, bases, -0.1).IsErr());
        std::vector<Basis> short_bases(10, Basis::Diagonal);
        auto mismatch = Bb84Simulator::SimulateQuantumChannel(bits, short_bases, 0.0);
        REQUIRE(mismatch.IsErr());
        REQUIRE(mismatch.UnwrapErr().type == QkdFailureType::InvalidInput);
        std::vector<uint8_t> not_bits = {0, 2};
        std::vector<Basis> two_bases = {Basis::Rectilinear, Basis::Rectilinear};
        REQUIRE(Bb84Simulator::SimulateQuantumChannel(not_bits, two_bases, 0.0).IsErr());
    }
}
TEST_CASE("Bb84Simulator - Sifting", "[bb84]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> alice_bits = {1, 0, 1, 1, 0};
    std::vector<Basis> alice_bases = {Basis::Rectilinear, Basis::Diagonal, Basis::Diagonal,
                                      Basis::Rectilinear, Basis::Rectilinear};
    std::vector<uint8_t> bob_bits = {1, 1, 1, 0, 0};
    std::vector<Basis> bob_bases = {Basis::Rectilinear, Basis::Rectilinear, Basis::Diagonal,
                                    Basis::Diagonal, Basis::Rectilinear};
    auto sifted = Bb84Simulator::SiftKey(alice_bits, alice_bases, bob_bits, bob_bases);
    REQUIRE(sifted.IsOk());
    REQUIRE(sifted.Unwrap().alice_bits == std::vector<uint8_t>{1, 1, 0});
    REQUIRE(sifted.Unwrap().bob_bits == std::vector<uint8_t>{1, 1, 0});
    REQUIRE(Bb84Simulator::SiftKey(alice_bits, alice_bases, bob_bits, {}).IsErr());
}
TEST_CASE("Bb84Simulator - Error rate estimation", "[bb84]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> alice = {0, 1, 0, 1, 0, 1, 0, 1, 0, 1};
    std::vector<uint8_t> bob = {0, 1, 1, 1, 0, 1, 0, 1, 0, 0};
    SECTION("Sample of the prefix") {
        auto rate = Bb84Simulator::EstimateErrorRate(alice, bob, 4);
        REQUIRE(rate.IsOk());
        REQUIRE_THAT(rate.Unwrap(), Catch::Matchers::WithinAbs(0.25, 1e-12));
    }
    SECTION("Short keys fall back to half their length") {
        auto rate = Bb84Simulator::EstimateErrorRate(alice, bob, 50);
        REQUIRE(rate.IsOk());
        REQUIRE_THAT(rate.Unwrap(), Catch::Matchers::WithinAbs(0.2, 1e-12));
    }
    SECTION("Empty keys estimate zero") {
        auto rate = Bb84Simulator::EstimateErrorRate({}, {}, 50);
        REQUIRE(rate.IsOk());
        REQUIRE(rate.Unwrap() == 0.0);
    }
}
TEST_CASE("Bb84Simulator - Privacy amplification and key ids", "[bb84]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> sifted = {1, 0, 1};
    auto key = Bb84Simulator::PrivacyAmplification(sifted, 256);
    REQUIRE(key.IsOk());
    REQUIRE(key.Unwrap().size() == 32);
    SECTION("Hash of the ASCII rendering") {
        const std::string rendered = "101";
        auto expected = crypto::Digest::HashExpand(std::vector<uint8_t>(rendered.begin(), rendered.end()), 32);
        REQUIRE(key.Unwrap() == expected.Unwrap());
    }
    SECTION("Lengths must be whole bytes") {
        REQUIRE(Bb84Simulator::PrivacyAmplification(sifted, 0).IsErr());
        REQUIRE(Bb84Simulator::PrivacyAmplification(sifted, 12).IsErr());
    }
    SECTION("Key id is a 16 character hex prefix of SHA-256") {
        auto key_id = Bb84Simulator::DeriveKeyId(key.Unwrap());
        REQUIRE(key_id.IsOk());
        REQUIRE(key_id.Unwrap().size() == 16);
        auto digest = crypto::Digest::Sha256(key.Unwrap());
        REQUIRE(SodiumInterop::ToHex(digest.Unwrap()).substr(0, 16) == key_id.Unwrap());
    }
}
TEST_CASE("Bb84Simulator - Full key generation", "[bb84]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Clean channel yields a key of the requested size") {
        Bb84Simulator simulator;
        auto generated = simulator.GenerateQuantumKey(256);
        REQUIRE(generated.IsOk());
        REQUIRE(generated.Unwrap().key_bytes.size() == 32);
        REQUIRE(generated.Unwrap().key_id.size() == 16);
    }
    SECTION("Default length comes from the configuration") {
        Bb84Simulator simulator(SimulatorConfig::Default().WithDefaultKeyLength(512));
        auto generated = simulator.GenerateQuantumKey();
        REQUIRE(generated.IsOk());
        REQUIRE(generated.Unwrap().key_bytes.size() == 64);
    }
    SECTION("Independent runs produce different keys") {
        Bb84Simulator simulator;
        auto first = simulator.GenerateQuantumKey(128);
        auto second = simulator.GenerateQuantumKey(128);
        REQUIRE(first.Unwrap().key_bytes != second.Unwrap().key_bytes);
    }
    SECTION("A tapped channel aborts with eavesdropping detected") {
        Bb84Simulator simulator(SimulatorConfig::Noisy(0.5));
        auto generated = simulator.GenerateQuantumKey(256);
        REQUIRE(generated.IsErr());
        REQUIRE(generated.UnwrapErr().type == QkdFailureType::EavesdroppingDetected);
    }
    SECTION("Invalid lengths") {
        Bb84Simulator simulator;
        REQUIRE(simulator.GenerateQuantumKey(7).IsErr());
        REQUIRE(simulator.GenerateQuantumKey(0).IsErr());
    }
}
