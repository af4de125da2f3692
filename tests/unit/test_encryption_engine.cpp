#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "qkmail/encryption/encryption_engine.hpp"
#include "qkmail/crypto/rsa_key_pair.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "helpers/test_fixtures.hpp"
using namespace qkmail;
using namespace qkmail::encryption;
using configuration::MaximumLevelOptions;
using crypto::RsaKeyPair;
using crypto::SodiumInterop;
using test_helpers::Bytes;
TEST_CASE("EncryptionEngine - One-time pad", "[encryption_engine]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::FromHex("000102030405060708090a0b0c0d0e0f").Unwrap();
    SECTION("Known answer") {
        auto encrypted = EncryptionEngine::Encrypt(Bytes("HELLO"), key, SecurityLevel::Basic);
        REQUIRE(encrypted.IsOk());
        REQUIRE(SodiumInterop::ToHex(encrypted.Unwrap().ciphertext) == "48444e4f4b");
        REQUIRE(std::holds_alternative<BasicMetadata>(encrypted.Unwrap().metadata));
        REQUIRE(std::get<BasicMetadata>(encrypted.Unwrap().metadata).key_length == 16);
        REQUIRE(AlgorithmOf(encrypted.Unwrap().metadata) == PackageConstants::ALGORITHM_OTP);

        auto decrypted = EncryptionEngine::Decrypt(
            encrypted.Unwrap().ciphertext, key, encrypted.Unwrap().metadata);
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == Bytes("HELLO"));
    }
    SECTION("Key shorter than the message is refused") {
        auto encrypted = EncryptionEngine::Encrypt(Bytes("seventeen bytes!!"), key, SecurityLevel::Basic);
        REQUIRE(encrypted.IsErr());
        REQUIRE(encrypted.UnwrapErr().type == QkdFailureType::KeyPolicy);
    }
    SECTION("Key exactly as long as the message") {
        const auto plaintext = Bytes("sixteen bytes!!!");
        auto encrypted = EncryptionEngine::Encrypt(plaintext, key, SecurityLevel::Basic);
        REQUIRE(encrypted.IsOk());
        REQUIRE(EncryptionEngine::Decrypt(encrypted.Unwrap().ciphertext, key,
            encrypted.Unwrap().metadata).Unwrap() == plaintext);
    }
}
TEST_CASE("EncryptionEngine - AEAD levels", "[encryption_engine]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(32);
    const auto plaintext = Bytes("Quarterly figures attached. Please do not forward.");
    const auto level = GENERATE(SecurityLevel::Standard, SecurityLevel::High);
    auto first = EncryptionEngine::Encrypt(plaintext, key, level);
    auto second = EncryptionEngine::Encrypt(plaintext, key, level);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(LevelOf(first.Unwrap().metadata) == level);
    REQUIRE(first.Unwrap().ciphertext.size() == plaintext.size() + Constants::AEAD_TAG_SIZE);
    REQUIRE(first.Unwrap().ciphertext != second.Unwrap().ciphertext);
    auto decrypted = EncryptionEngine::Decrypt(first.Unwrap().ciphertext, key, first.Unwrap().metadata);
    REQUIRE(decrypted.IsOk());
    REQUIRE(decrypted.Unwrap() == plaintext);
    SECTION("Any key length is accepted") {
        const auto short_key = SodiumInterop::GetRandomBytes(5);
        auto encrypted = EncryptionEngine::Encrypt(plaintext, short_key, level);
        REQUIRE(encrypted.IsOk());
        REQUIRE(EncryptionEngine::Decrypt(encrypted.Unwrap().ciphertext, short_key,
            encrypted.Unwrap().metadata).Unwrap() == plaintext);
    }
    SECTION("Empty message") {
        auto encrypted = EncryptionEngine::Encrypt({}, key, level);
        REQUIRE(encrypted.IsOk());
        auto empty = EncryptionEngine::Decrypt(encrypted.Unwrap().ciphertext, key, encrypted.Unwrap().metadata);
        REQUIRE(empty.IsOk());
        REQUIRE(empty.Unwrap().empty());
    }
}
TEST_CASE("EncryptionEngine - High level without key mixing", "[encryption_engine]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(32);
    auto encrypted = EncryptionEngine::Encrypt(Bytes("mixing"), key, SecurityLevel::High);
    REQUIRE(encrypted.IsOk());
    auto metadata = std::get<HighMetadata>(encrypted.Unwrap().metadata);
    REQUIRE(metadata.key_mixing);
    metadata.key_mixing = false;
    auto unmixed = EncryptionEngine::Decrypt(encrypted.Unwrap().ciphertext, key, metadata);
    REQUIRE(unmixed.IsErr());
    REQUIRE(unmixed.UnwrapErr().type == QkdFailureType::CryptoIntegrity);
}
TEST_CASE("EncryptionEngine - Maximum level", "[encryption_engine]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(32);
    const auto plaintext = Bytes("Board minutes, restricted distribution");
    SECTION("RSA-wrapped ephemeral key") {
        auto recipient = RsaKeyPair::Generate(2048);
        REQUIRE(recipient.IsOk());
        auto public_only = RsaKeyPair::FromPublicKeyPem(recipient.Unwrap().PublicKeyPem().Unwrap());
        REQUIRE(public_only.IsOk());
        MaximumLevelOptions options;
        options.recipient_public_key = &public_only.Unwrap();
        auto encrypted = EncryptionEngine::Encrypt(plaintext, key, SecurityLevel::Maximum, options);
        REQUIRE(encrypted.IsOk());
        const auto& metadata = std::get<MaximumMetadata>(encrypted.Unwrap().metadata);
        REQUIRE(metadata.ephemeral_mode == EphemeralMode::RsaWrapped);
        REQUIRE(metadata.encrypted_key.size() == 256);
        REQUIRE(metadata.quantum_enhanced);

        auto decrypted = EncryptionEngine::Decrypt(
            encrypted.Unwrap().ciphertext, key, encrypted.Unwrap().metadata, &recipient.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);

        auto without_private = EncryptionEngine::Decrypt(
            encrypted.Unwrap().ciphertext, key, encrypted.Unwrap().metadata);
        REQUIRE(without_private.IsErr());
        REQUIRE(without_private.UnwrapErr().type == QkdFailureType::KeyPolicy);

        auto public_cannot_unwrap = EncryptionEngine::Decrypt(
            encrypted.Unwrap().ciphertext, key, encrypted.Unwrap().metadata, &public_only.Unwrap());
        REQUIRE(public_cannot_unwrap.IsErr());
        REQUIRE(public_cannot_unwrap.UnwrapErr().type == QkdFailureType::KeyPolicy);
    }
    SECTION("Quantum-derived ephemeral key needs explicit opt-in") {
        auto refused = EncryptionEngine::Encrypt(plaintext, key, SecurityLevel::Maximum);
        REQUIRE(refused.IsErr());
        REQUIRE(refused.UnwrapErr().type == QkdFailureType::KeyPolicy);

        MaximumLevelOptions options;
        options.allow_quantum_derived_ephemeral = true;
        auto encrypted = EncryptionEngine::Encrypt(plaintext, key, SecurityLevel::Maximum, options);
        REQUIRE(encrypted.IsOk());
        const auto& metadata = std::get<MaximumMetadata>(encrypted.Unwrap().metadata);
        REQUIRE(metadata.ephemeral_mode == EphemeralMode::QuantumDerived);
        REQUIRE(metadata.encrypted_key.empty());
        auto decrypted = EncryptionEngine::Decrypt(encrypted.Unwrap().ciphertext, key, encrypted.Unwrap().metadata);
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }
    SECTION("RSA mode without a wrapped key is malformed") {
        MaximumMetadata metadata;
        metadata.nonce = SodiumInterop::GetRandomBytes(Constants::AEAD_NONCE_SIZE);
        metadata.ephemeral_mode = EphemeralMode::RsaWrapped;
        auto decrypted = EncryptionEngine::Decrypt(Bytes("0123456789abcdef0123"), key, metadata);
        REQUIRE(decrypted.IsErr());
        REQUIRE(decrypted.UnwrapErr().type == QkdFailureType::Decode);
    }
}
TEST_CASE("EncryptionEngine - Input validation", "[encryption_engine]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto encrypted = EncryptionEngine::Encrypt(Bytes("text"), {}, SecurityLevel::Standard);
    REQUIRE(encrypted.IsErr());
    REQUIRE(encrypted.UnwrapErr().type == QkdFailureType::InvalidInput);

    const auto key = SodiumInterop::GetRandomBytes(32);
    StandardMetadata bad_nonce{SodiumInterop::GetRandomBytes(8)};
    auto decrypted = EncryptionEngine::Decrypt(Bytes("0123456789abcdef0123"), key, bad_nonce);
    REQUIRE(decrypted.IsErr());
    REQUIRE(decrypted.UnwrapErr().type == QkdFailureType::Decode);

    STATIC_REQUIRE_FALSE(SecurityLevelFromInt(0).has_value());
    STATIC_REQUIRE_FALSE(SecurityLevelFromInt(5).has_value());
    STATIC_REQUIRE(SecurityLevelFromInt(3) == SecurityLevel::High);
}
