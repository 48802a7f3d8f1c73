#include <catch2/catch_test_macros.hpp>
#include "sectrust/configuration/routing_config.hpp"
using namespace sectrust;
using namespace sectrust::configuration;

TEST_CASE("RoutingConfig - Presets", "[config]") {
    SECTION("Default is valid") {
        constexpr auto config = RoutingConfig::Default();
        static_assert(config.elder_size == 7);
        REQUIRE(config.Validate().IsOk());
        REQUIRE(config.Quorum() == 4);
    }
    SECTION("Testing preset is valid") {
        const auto config = RoutingConfig::ForTesting();
        REQUIRE(config.Validate().IsOk());
        REQUIRE(config.elder_size == 3);
        REQUIRE(config.Quorum() == 2);
    }
}

TEST_CASE("RoutingConfig - Quorum is a strict majority", "[config]") {
    REQUIRE(RoutingConfig::QuorumCount(1) == 1);
    REQUIRE(RoutingConfig::QuorumCount(2) == 2);
    REQUIRE(RoutingConfig::QuorumCount(3) == 2);
    REQUIRE(RoutingConfig::QuorumCount(4) == 3);
    REQUIRE(RoutingConfig::QuorumCount(7) == 4);
    for (size_t n = 1; n <= 20; ++n) {
        REQUIRE(RoutingConfig::QuorumCount(n) * 2 > n);
    }
}

TEST_CASE("RoutingConfig - Validation", "[config]") {
    auto config = RoutingConfig::Default();
    SECTION("Zero elders") {
        config.elder_size = 0;
        auto result = config.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RoutingFailureType::InvalidInput);
    }
    SECTION("Too many elders") {
        config.elder_size = RoutingConstants::MAX_ELDER_SIZE + 1;
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Zero message size") {
        config.max_message_size = 0;
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Zero chain length") {
        config.max_proof_chain_length = 0;
        REQUIRE(config.Validate().IsErr());
    }
}

TEST_CASE("RoutingConfig - Message size fits one protobuf parse", "[config]") {
    auto config = RoutingConfig::Default();
    SECTION("The largest parseable size is accepted") {
        config.max_message_size = RoutingConstants::MAX_MESSAGE_SIZE_LIMIT;
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Anything larger is rejected") {
        config.max_message_size = RoutingConstants::MAX_MESSAGE_SIZE_LIMIT + 1;
        auto result = config.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RoutingFailureType::InvalidInput);
    }
}
