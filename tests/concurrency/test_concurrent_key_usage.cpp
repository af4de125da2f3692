#include <catch2/catch_test_macros.hpp>
#include "qkmail/keys/key_manager.hpp"
#include "qkmail/keys/in_memory_key_repository.hpp"
#include "qkmail/providers/local_key_provider.hpp"
#include "qkmail/crypto/sodium_interop.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace qkmail;
using namespace qkmail::keys;
using configuration::KeyPolicy;
using crypto::SodiumInterop;

TEST_CASE("Concurrency - Usage cap holds under contention", "[concurrency][key_manager]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("64 threads racing for a two-use key") {
        KeyManager manager("alice", std::make_unique<InMemoryKeyRepository>(), nullptr,
            KeyPolicy::Custom(std::chrono::seconds(600), 2));
        const std::vector<uint8_t> key(32, 0x77);
        REQUIRE(manager.StoreKey("contended", key, KeyMetadata{"bob", KeyRole::Master, "local-bb84", "", 0}).Unwrap());

        constexpr int THREAD_COUNT = 64;
        std::atomic<int> served{0};
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                auto entry = manager.GetKey("contended");
                if (entry.IsErr()) {
                    failures.fetch_add(1);
                } else if (entry.Unwrap().has_value()) {
                    served.fetch_add(1);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(served.load() == 2);
        auto listed = manager.ListKeys().Unwrap();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].usage_count == 2);
        REQUIRE(listed[0].state == KeyState::Consumed);
    }

    SECTION("Parallel store, read and delete over distinct keys") {
        KeyManager manager("alice", std::make_unique<InMemoryKeyRepository>(), nullptr,
            KeyPolicy::Unlimited(std::chrono::seconds(600)));
        constexpr int THREAD_COUNT = 16;
        constexpr int KEYS_PER_THREAD = 50;
        std::atomic<bool> mismatch{false};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < KEYS_PER_THREAD; ++i) {
                    const std::string key_id = "k-" + std::to_string(t) + "-" + std::to_string(i);
                    const std::vector<uint8_t> key(32, static_cast<uint8_t>(t));
                    auto stored = manager.StoreKey(key_id, key, KeyMetadata{"bob", KeyRole::Master, "local-bb84", "", 0});
                    if (stored.IsErr() || !stored.Unwrap()) {
                        mismatch.store(true);
                        continue;
                    }
                    auto entry = manager.GetKey(key_id);
                    if (entry.IsErr() || !entry.Unwrap().has_value() || entry.Unwrap()->key_bytes != key) {
                        mismatch.store(true);
                    }
                    if (i % 2 == 0) {
                        auto deleted = manager.DeleteKey(key_id);
                        if (deleted.IsErr() || !deleted.Unwrap()) {
                            mismatch.store(true);
                        }
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE_FALSE(mismatch.load());
        REQUIRE(manager.ListKeys().Unwrap().size() == THREAD_COUNT * KEYS_PER_THREAD / 2);
    }
}

TEST_CASE("Concurrency - Shared local channel", "[concurrency][local_channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto channel = std::make_shared<qkd::LocalKeyChannel>();
    KeyManager alice("alice", std::make_unique<InMemoryKeyRepository>(),
        std::make_shared<providers::LocalKeyProvider>(channel), KeyPolicy::Interactive());

    constexpr int THREAD_COUNT = 8;
    constexpr int KEYS_PER_THREAD = 4;
    std::mutex ids_mutex;
    std::set<std::string> ids;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < KEYS_PER_THREAD; ++i) {
                auto key = alice.RequestQuantumKey("bob", 128);
                if (key.IsErr()) {
                    failures.fetch_add(1);
                    continue;
                }
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.insert(key.Unwrap().key_id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(ids.size() == THREAD_COUNT * KEYS_PER_THREAD);
    REQUIRE(channel->Size() == THREAD_COUNT * KEYS_PER_THREAD);
}
