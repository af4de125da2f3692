#include <catch2/catch_test_macros.hpp>
#include "qkmail/qkd/local_key_channel.hpp"
#include "qkmail/providers/local_key_provider.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include <memory>
#include <stdexcept>
using namespace qkmail;
using namespace qkmail::qkd;
using configuration::SimulatorConfig;
using crypto::SodiumInterop;
using providers::LocalKeyProvider;
TEST_CASE("LocalKeyChannel - Establishing keys", "[local_channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    LocalKeyChannel channel;
    SECTION("Both parties read the same key by id") {
        auto established = channel.EstablishKeyPair("alice", "bob");
        REQUIRE(established.IsOk());
        const auto& generated = established.Unwrap();
        REQUIRE(generated.key_bytes.size() == 32);
        auto stored = channel.GetKey(generated.key_id);
        REQUIRE(stored.IsOk());
        REQUIRE(stored.Unwrap() == generated.key_bytes);
        REQUIRE(channel.Size() == 1);
    }
    SECTION("Length override applies to one call") {
        auto long_key = channel.EstablishKeyPair("alice", "bob", 1024);
        REQUIRE(long_key.IsOk());
        REQUIRE(long_key.Unwrap().key_bytes.size() == 128);
        auto default_key = channel.EstablishKeyPair("alice", "bob");
        REQUIRE(default_key.Unwrap().key_bytes.size() == 32);
    }
    SECTION("Removed keys are gone from the channel") {
        auto established = channel.EstablishKeyPair("alice", "bob");
        REQUIRE(established.IsOk());
        const std::string key_id = established.Unwrap().key_id;
        REQUIRE(channel.Remove(key_id));
        REQUIRE(channel.Size() == 0);
        REQUIRE_FALSE(channel.Remove(key_id));
        auto missing = channel.GetKey(key_id);
        REQUIRE(missing.IsErr());
        REQUIRE(missing.UnwrapErr().type == QkdFailureType::KeyNotFound);
    }
    SECTION("Unknown ids are KeyNotFound") {
        auto missing = channel.GetKey("0000000000000000");
        REQUIRE(missing.IsErr());
        REQUIRE(missing.UnwrapErr().type == QkdFailureType::KeyNotFound);
    }
    SECTION("Parties are required") {
        auto result = channel.EstablishKeyPair("", "bob");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == QkdFailureType::InvalidInput);
    }
}
TEST_CASE("LocalKeyChannel - Eavesdropping aborts the exchange", "[local_channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    LocalKeyChannel channel(SimulatorConfig::Noisy(0.5));
    auto result = channel.EstablishKeyPair("alice", "bob");
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == QkdFailureType::EavesdroppingDetected);
    REQUIRE(channel.Size() == 0);
}
TEST_CASE("LocalKeyProvider - Master and slave flows", "[local_channel][provider]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto channel = std::make_shared<LocalKeyChannel>();
    LocalKeyProvider sender(channel);
    LocalKeyProvider receiver(channel);
    auto requested = sender.RequestKey("alice", "bob", 256);
    REQUIRE(requested.IsOk());
    const auto& provisioned = requested.Unwrap();
    REQUIRE(provisioned.provenance.Label() == "local-bb84");
    REQUIRE_FALSE(provisioned.provenance.expires_in.has_value());
    SECTION("Receiver retrieves the same material") {
        REQUIRE(channel->Size() == 1);
        auto retrieved = receiver.RetrieveKey("alice", provisioned.key_id);
        REQUIRE(retrieved.IsOk());
        REQUIRE(retrieved.Unwrap().key_bytes == provisioned.key_bytes);
        REQUIRE(channel->Size() == 0);
        auto again = receiver.RetrieveKey("alice", provisioned.key_id);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == QkdFailureType::KeyLifecycleMiss);
    }
    SECTION("Unknown id is a lifecycle miss") {
        auto retrieved = receiver.RetrieveKey("alice", "ffffffffffffffff");
        REQUIRE(retrieved.IsErr());
        REQUIRE(retrieved.UnwrapErr().type == QkdFailureType::KeyLifecycleMiss);
    }
    SECTION("Null channel is rejected") {
        REQUIRE_THROWS_AS(LocalKeyProvider(nullptr), std::invalid_argument);
    }
}
