#include <catch2/catch_test_macros.hpp>
#include "qkmail/keys/key_manager.hpp"
#include "qkmail/keys/key_exchange.hpp"
#include "qkmail/keys/in_memory_key_repository.hpp"
#include "qkmail/providers/local_key_provider.hpp"
#include "qkmail/providers/remote_key_provider.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include "helpers/mock_kme_transport.hpp"
#include "helpers/test_fixtures.hpp"
#include <memory>
#include <set>
#include <stdexcept>
using namespace qkmail;
using namespace qkmail::keys;
using configuration::KeyPolicy;
using crypto::SodiumInterop;
using providers::LocalKeyProvider;
using test_helpers::FakeClock;
namespace {
    KeyMetadata PeerMetadata(const std::string& peer) {
        return KeyMetadata{peer, KeyRole::Master, "local-bb84", "", 0};
    }

    std::unique_ptr<KeyManager> MakeManager(
        const std::string& owner,
        const KeyPolicy policy,
        const FakeClock& clock,
        std::shared_ptr<interfaces::IQkdKeyProvider> provider = nullptr) {
        return std::make_unique<KeyManager>(
            owner, std::make_unique<InMemoryKeyRepository>(), std::move(provider), policy, clock.AsClock());
    }
}
TEST_CASE("KeyManager - Store and get", "[key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    auto manager = MakeManager("alice", KeyPolicy::Unlimited(std::chrono::hours(1)), clock);
    const std::vector<uint8_t> key(32, 0x5A);
    SECTION("Stored key is returned with its metadata") {
        REQUIRE(manager->StoreKey("key-1", key, PeerMetadata("bob")).Unwrap());
        auto entry = manager->GetKey("key-1");
        REQUIRE(entry.IsOk());
        REQUIRE(entry.Unwrap().has_value());
        REQUIRE(entry.Unwrap()->key_bytes == key);
        REQUIRE(entry.Unwrap()->metadata.peer_id == "bob");
        REQUIRE(entry.Unwrap()->metadata.key_length_bits == 256);
        REQUIRE(entry.Unwrap()->usage_count == 1);
        REQUIRE(entry.Unwrap()->expires_at == clock.Now() + std::chrono::hours(1));
    }
    SECTION("Duplicate ids are refused without overwriting") {
        REQUIRE(manager->StoreKey("key-1", key, PeerMetadata("bob")).Unwrap());
        const std::vector<uint8_t> other(32, 0x11);
        auto again = manager->StoreKey("key-1", other, PeerMetadata("carol"));
        REQUIRE(again.IsOk());
        REQUIRE_FALSE(again.Unwrap());
        REQUIRE(manager->GetKey("key-1").Unwrap()->key_bytes == key);
    }
    SECTION("Invalid input") {
        REQUIRE(manager->StoreKey("key-1", {}, PeerMetadata("bob")).UnwrapErr().type ==
            QkdFailureType::InvalidInput);
        REQUIRE(manager->StoreKey("../escape", key, PeerMetadata("bob")).UnwrapErr().type ==
            QkdFailureType::InvalidInput);
        REQUIRE(manager->StoreKey(".hidden", key, PeerMetadata("bob")).IsErr());
        REQUIRE(manager->StoreKey(std::string(129, 'a'), key, PeerMetadata("bob")).IsErr());
    }
    SECTION("Unknown key is an empty result, not an error") {
        auto missing = manager->GetKey("nope");
        REQUIRE(missing.IsOk());
        REQUIRE_FALSE(missing.Unwrap().has_value());
    }
}
TEST_CASE("KeyManager - Usage limits", "[key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    const std::vector<uint8_t> key(32, 0x42);
    SECTION("Interactive keys serve exactly once") {
        auto manager = MakeManager("alice", KeyPolicy::Interactive(), clock);
        REQUIRE(manager->StoreKey("k", key, PeerMetadata("bob")).Unwrap());
        auto first = manager->GetKey("k");
        REQUIRE(first.Unwrap().has_value());
        REQUIRE(first.Unwrap()->state == KeyState::Consumed);
        REQUIRE_FALSE(manager->GetKey("k").Unwrap().has_value());
    }
    SECTION("Storage keys serve twice") {
        auto manager = MakeManager("alice", KeyPolicy::Storage(), clock);
        REQUIRE(manager->StoreKey("k", key, PeerMetadata("bob")).Unwrap());
        REQUIRE(manager->GetKey("k").Unwrap().has_value());
        REQUIRE(manager->GetKey("k").Unwrap().has_value());
        REQUIRE_FALSE(manager->GetKey("k").Unwrap().has_value());
        auto listed = manager->ListKeys().Unwrap();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].state == KeyState::Consumed);
        REQUIRE(listed[0].usage_count == 2);
    }
    SECTION("Unlimited keys serve until expiry") {
        auto manager = MakeManager("alice", KeyPolicy::Unlimited(std::chrono::seconds(60)), clock);
        REQUIRE(manager->StoreKey("k", key, PeerMetadata("bob")).Unwrap());
        for (int i = 0; i < 10; ++i) {
            REQUIRE(manager->GetKey("k").Unwrap().has_value());
        }
    }
}
TEST_CASE("KeyManager - Expiry", "[key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    auto manager = MakeManager("alice", KeyPolicy::Custom(std::chrono::seconds(600), 5), clock);
    const std::vector<uint8_t> key(32, 0x42);
    REQUIRE(manager->StoreKey("k", key, PeerMetadata("bob")).Unwrap());
    SECTION("Key is served just before expiry") {
        clock.Advance(std::chrono::seconds(599));
        REQUIRE(manager->GetKey("k").Unwrap().has_value());
    }
    SECTION("Key is withheld at expiry and marked expired") {
        clock.Advance(std::chrono::seconds(600));
        REQUIRE_FALSE(manager->GetKey("k").Unwrap().has_value());
        auto listed = manager->ListKeys().Unwrap();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].state == KeyState::Expired);
        clock.Advance(std::chrono::seconds(-3600));
        REQUIRE_FALSE(manager->GetKey("k").Unwrap().has_value());
    }
}
TEST_CASE("KeyManager - Delete and cleanup", "[key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    auto manager = MakeManager("alice", KeyPolicy::Custom(std::chrono::seconds(60), 1), clock);
    const std::vector<uint8_t> key(32, 0x42);
    SECTION("Deleted ids are retired") {
        REQUIRE(manager->StoreKey("k", key, PeerMetadata("bob")).Unwrap());
        REQUIRE(manager->DeleteKey("k").Unwrap());
        REQUIRE_FALSE(manager->DeleteKey("k").Unwrap());
        REQUIRE_FALSE(manager->GetKey("k").Unwrap().has_value());
        REQUIRE_FALSE(manager->StoreKey("k", key, PeerMetadata("bob")).Unwrap());
        REQUIRE(manager->ListKeys().Unwrap().empty());
    }
    SECTION("Cleanup removes expired and consumed keys only") {
        REQUIRE(manager->StoreKey("consumed", key, PeerMetadata("bob")).Unwrap());
        REQUIRE(manager->GetKey("consumed").Unwrap().has_value());
        REQUIRE(manager->StoreKey("stale", key, PeerMetadata("bob")).Unwrap());
        clock.Advance(std::chrono::seconds(61));
        REQUIRE(manager->StoreKey("fresh", key, PeerMetadata("bob")).Unwrap());
        auto removed = manager->CleanupExpiredKeys();
        REQUIRE(removed.IsOk());
        REQUIRE(removed.Unwrap() == 2);
        auto listed = manager->ListKeys().Unwrap();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].key_id == "fresh");
        REQUIRE_FALSE(manager->StoreKey("stale", key, PeerMetadata("bob")).Unwrap());
    }
}
TEST_CASE("KeyManager - Quantum key flows over a local channel", "[key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    auto channel = std::make_shared<qkd::LocalKeyChannel>();
    auto alice = MakeManager("alice", KeyPolicy::Interactive(), clock, std::make_shared<LocalKeyProvider>(channel));
    auto bob = MakeManager("bob", KeyPolicy::Interactive(), clock, std::make_shared<LocalKeyProvider>(channel));
    auto requested = alice->RequestQuantumKey("bob", 256);
    REQUIRE(requested.IsOk());
    const QuantumKey sender_key = requested.Unwrap();
    REQUIRE(sender_key.key_bytes.size() == 32);
    SECTION("Requester has already taken its single use") {
        REQUIRE_FALSE(alice->GetKey(sender_key.key_id).Unwrap().has_value());
        auto listed = alice->ListKeys().Unwrap();
        REQUIRE(listed[0].metadata.role == KeyRole::Master);
        REQUIRE(listed[0].metadata.peer_id == "bob");
        REQUIRE(listed[0].metadata.provenance == "local-bb84");
    }
    SECTION("Receiver retrieves the same key as slave") {
        auto retrieved = bob->RetrieveQuantumKey("alice", sender_key.key_id);
        REQUIRE(retrieved.IsOk());
        REQUIRE(retrieved.Unwrap().key_bytes == sender_key.key_bytes);
        auto listed = bob->ListKeys().Unwrap();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].metadata.role == KeyRole::Slave);
        REQUIRE(listed[0].metadata.peer_id == "alice");
        SECTION("A consumed local copy is not fetched again") {
            auto again = bob->RetrieveQuantumKey("alice", sender_key.key_id);
            REQUIRE(again.IsErr());
            REQUIRE(again.UnwrapErr().type == QkdFailureType::KeyLifecycleMiss);
        }
    }
    SECTION("Unknown id is a lifecycle miss") {
        auto missing = bob->RetrieveQuantumKey("alice", "0123456789abcdef");
        REQUIRE(missing.IsErr());
        REQUIRE(missing.UnwrapErr().type == QkdFailureType::KeyLifecycleMiss);
    }
    SECTION("Without a provider the master flow is a policy failure") {
        auto standalone = MakeManager("carol", KeyPolicy::Interactive(), clock);
        auto result = standalone->RequestQuantumKey("bob");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == QkdFailureType::KeyPolicy);
    }
}
TEST_CASE("KeyManager - Provider lifetime caps the policy TTL", "[key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    auto transport = std::make_shared<test_helpers::MockKmeTransport>();
    transport->QueueResponse("/api/v1/keys/SAE_B/status", 200, R"({"stored_key_count": 3, "key_expiry_time": 30})");
    transport->QueueResponse("/api/v1/keys/SAE_B/enc_keys", 200,
        R"({"keys": [{"key_ID": "6f1c2e0a-0000-4000-8000-000000000001", "key": "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8="}]})");
    auto provider = std::make_shared<providers::RemoteKeyProvider>("SAE_A", "/api/v1", transport);
    auto manager = MakeManager("SAE_A", KeyPolicy::Storage(), clock, provider);
    auto requested = manager->RequestQuantumKey("SAE_B", 256);
    REQUIRE(requested.IsOk());
    auto listed = manager->ListKeys().Unwrap();
    REQUIRE(listed.size() == 1);
    REQUIRE(listed[0].expires_at == clock.Now() + std::chrono::seconds(30));
    REQUIRE(listed[0].metadata.provenance == "qukaydee/ETSI-GS-QKD-014");
    clock.Advance(std::chrono::seconds(31));
    REQUIRE_FALSE(manager->GetKey(requested.Unwrap().key_id).Unwrap().has_value());
}
TEST_CASE("KeyManager - Provisioned key ids are unique", "[key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    SECTION("Repeated local requests yield distinct ids") {
        auto channel = std::make_shared<qkd::LocalKeyChannel>();
        auto alice = MakeManager("alice", KeyPolicy::Storage(), clock, std::make_shared<LocalKeyProvider>(channel));
        std::set<std::string> ids;
        for (int i = 0; i < 8; ++i) {
            auto requested = alice->RequestQuantumKey("bob", 128);
            REQUIRE(requested.IsOk());
            ids.insert(requested.Unwrap().key_id);
        }
        REQUIRE(ids.size() == 8);
        REQUIRE(alice->ListKeys().Unwrap().size() == 8);
    }
    SECTION("A KME reissuing a stored id is a protocol failure") {
        const std::string reissued =
            R"({"keys": [{"key_ID": "6f1c2e0a-0000-4000-8000-000000000002", "key": "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8="}]})";
        auto transport = std::make_shared<test_helpers::MockKmeTransport>();
        for (int i = 0; i < 2; ++i) {
            transport->QueueResponse("/api/v1/keys/SAE_B/status", 200, R"({"stored_key_count": 3})");
            transport->QueueResponse("/api/v1/keys/SAE_B/enc_keys", 200, reissued);
        }
        auto provider = std::make_shared<providers::RemoteKeyProvider>("SAE_A", "/api/v1", transport);
        auto manager = MakeManager("SAE_A", KeyPolicy::Storage(), clock, provider);
        REQUIRE(manager->RequestQuantumKey("SAE_B", 256).IsOk());
        auto second = manager->RequestQuantumKey("SAE_B", 256);
        REQUIRE(second.IsErr());
        REQUIRE(second.UnwrapErr().type == QkdFailureType::ProviderProtocol);
        auto listed = manager->ListKeys().Unwrap();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].usage_count == 1);
    }
}
TEST_CASE("KeyExchange - Pre-shared keys between two managers", "[key_manager][key_exchange]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    FakeClock clock;
    auto channel = std::make_shared<qkd::LocalKeyChannel>();
    auto alice = MakeManager("alice", KeyPolicy::Storage(), clock);
    auto bob = MakeManager("bob", KeyPolicy::Storage(), clock);
    KeyExchange exchange(channel);
    auto shared = exchange.EstablishSharedKey(*alice, *bob, 512);
    REQUIRE(shared.IsOk());
    const std::string key_id = shared.Unwrap();
    auto alice_entry = alice->GetKey(key_id).Unwrap();
    auto bob_entry = bob->GetKey(key_id).Unwrap();
    REQUIRE(alice_entry.has_value());
    REQUIRE(bob_entry.has_value());
    REQUIRE(alice_entry->key_bytes == bob_entry->key_bytes);
    REQUIRE(alice_entry->key_bytes.size() == 64);
    REQUIRE(alice_entry->metadata.peer_id == "bob");
    REQUIRE(bob_entry->metadata.peer_id == "alice");
    REQUIRE(alice_entry->metadata.role == KeyRole::Master);
    REQUIRE(bob_entry->metadata.role == KeyRole::Slave);
    REQUIRE(alice_entry->metadata.purpose == "email_encryption");
    REQUIRE(channel->Size() == 0);
    SECTION("Same party on both ends is rejected") {
        auto self = exchange.EstablishSharedKey(*alice, *alice);
        REQUIRE(self.IsErr());
        REQUIRE(self.UnwrapErr().type == QkdFailureType::InvalidInput);
    }
    REQUIRE_THROWS_AS(KeyExchange(nullptr), std::invalid_argument);
}
TEST_CASE("KeyManager - Construction", "[key_manager]") {
    REQUIRE_THROWS_AS(KeyManager("alice", nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(KeyManager("", std::make_unique<InMemoryKeyRepository>()), std::invalid_argument);
}
