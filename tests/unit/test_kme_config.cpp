#include <catch2/catch_test_macros.hpp>
#include "qkmail/configuration/kme_config.hpp"
#include "qkmail/configuration/key_policy.hpp"
#include "qkmail/configuration/simulator_config.hpp"
#include "qkmail/providers/https_kme_transport.hpp"
#include "qkmail/providers/remote_key_provider.hpp"
using namespace qkmail;
using namespace qkmail::configuration;
TEST_CASE("KmeConfig - QuKayDee endpoints", "[config]") {
    auto config = KmeConfig::ForQuKayDee("2507", "kme-1", "sae-1", "ca.crt", "sae-1.crt", "sae-1.key");
    REQUIRE(config.host == "kme-1.acct-2507.etsi-qkd-api.qukaydee.com");
    REQUIRE(config.port == 443);
    REQUIRE(config.BaseUrl() == "https://kme-1.acct-2507.etsi-qkd-api.qukaydee.com/api/v1");
    REQUIRE(config.timeout == std::chrono::seconds(10));
    SECTION("Non-default port appears in the URL") {
        config.port = 8443;
        REQUIRE(config.BaseUrl() == "https://kme-1.acct-2507.etsi-qkd-api.qukaydee.com:8443/api/v1");
    }
}
TEST_CASE("KmeConfig - Transport creation validates credentials", "[config]") {
    SECTION("Missing host") {
        KmeConfig config;
        config.sae_id = "sae-1";
        auto transport = providers::HttpsKmeTransport::Create(config);
        REQUIRE(transport.IsErr());
        REQUIRE(transport.UnwrapErr().type == QkdFailureType::InvalidInput);
    }
    SECTION("Unreadable certificate files") {
        auto config = KmeConfig::ForQuKayDee("1", "kme-1", "sae-1",
            "/nonexistent/ca.crt", "/nonexistent/sae.crt", "/nonexistent/sae.key");
        auto transport = providers::HttpsKmeTransport::Create(config);
        REQUIRE(transport.IsErr());
        REQUIRE(transport.UnwrapErr().type == QkdFailureType::ProviderTransport);
    }
    SECTION("Provider connect needs an SAE id") {
        auto config = KmeConfig::ForQuKayDee("1", "kme-1", "", "ca.crt", "sae.crt", "sae.key");
        auto provider = providers::RemoteKeyProvider::Connect(config);
        REQUIRE(provider.IsErr());
        REQUIRE(provider.UnwrapErr().type == QkdFailureType::InvalidInput);
    }
}
TEST_CASE("KeyPolicy - Presets", "[config]") {
    STATIC_REQUIRE(KeyPolicy::Interactive().Ttl() == std::chrono::minutes(10));
    STATIC_REQUIRE(KeyPolicy::Interactive().MaxUsage() == 1u);
    STATIC_REQUIRE(KeyPolicy::Storage().Ttl() == std::chrono::hours(24));
    STATIC_REQUIRE(KeyPolicy::Storage().MaxUsage() == 2u);
    STATIC_REQUIRE_FALSE(KeyPolicy::Unlimited(std::chrono::seconds(60)).MaxUsage().has_value());
    STATIC_REQUIRE(KeyPolicy::Default().MaxUsage() == KeyPolicy::Storage().MaxUsage());
}
TEST_CASE("SimulatorConfig - Builders", "[config]") {
    constexpr auto config = SimulatorConfig::Noisy(0.02).WithDefaultKeyLength(512).WithErrorThreshold(0.2);
    STATIC_REQUIRE(config.DefaultKeyLengthBits() == 512);
    STATIC_REQUIRE(config.ChannelErrorRate() == 0.02);
    STATIC_REQUIRE(config.ErrorThreshold() == 0.2);
    STATIC_REQUIRE(config.OversamplingFactor() == 4);
}
