#include <catch2/catch_test_macros.hpp>
#include "qkmail/core/result.hpp"
#include "qkmail/core/failures.hpp"
#include <memory>
#include <stdexcept>
#include <string>
using namespace qkmail;
TEST_CASE("Result - Ok and Err construction", "[result]") {
    SECTION("Ok carries a value") {
        auto result = Result<int, QkdFailure>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err carries the failure type and message") {
        auto result = Result<int, QkdFailure>::Err(QkdFailure::KeyPolicy("too short"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == QkdFailureType::KeyPolicy);
        REQUIRE(result.UnwrapErr().message == "too short");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, QkdFailure>::Err(QkdFailure::Generic("boom"));
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, QkdFailure>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::logic_error);
    }
}
TEST_CASE("Result - Combinators", "[result]") {
    SECTION("Map transforms the Ok value") {
        auto mapped = Result<int, QkdFailure>::Ok(20).Map([](int v) { return std::to_string(v * 2); });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == "40");
    }
    SECTION("Map leaves an Err untouched") {
        auto mapped = Result<int, QkdFailure>::Err(QkdFailure::Decode("bad"))
            .Map([](int v) { return v + 1; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == QkdFailureType::Decode);
    }
    SECTION("MapErr converts the failure") {
        auto mapped = Result<int, SodiumFailure>::Err(SodiumFailure::EncodingFailed("hex"))
            .MapErr([](const SodiumFailure& f) { return QkdFailure::Decode(f.message); });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == QkdFailureType::Decode);
        REQUIRE(mapped.UnwrapErr().message.find("hex") != std::string::npos);
    }
    SECTION("UnwrapOr falls back on Err") {
        REQUIRE(Result<int, QkdFailure>::Err(QkdFailure::Generic("x")).UnwrapOr(7) == 7);
        REQUIRE(Result<int, QkdFailure>::Ok(3).UnwrapOr(7) == 3);
    }
    SECTION("Move-only values") {
        auto result = Result<std::unique_ptr<int>, QkdFailure>::Ok(std::make_unique<int>(5));
        auto value = std::move(result).Unwrap();
        REQUIRE(*value == 5);
    }
}
TEST_CASE("Result - Failure type names", "[result]") {
    REQUIRE(FailureTypeName(QkdFailureType::ProviderTransport) == "ProviderTransport");
    REQUIRE(FailureTypeName(QkdFailureType::CryptoIntegrity) == "CryptoIntegrity");
    REQUIRE(FailureTypeName(QkdFailureType::KeyLifecycleMiss) == "KeyLifecycleMiss");
}
