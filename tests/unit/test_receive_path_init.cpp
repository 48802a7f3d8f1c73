#include <catch2/catch_test_macros.hpp>
#include "sectrust/crypto/sodium_interop.hpp"
#include "sectrust/identity/public_id.hpp"
#include <vector>
using namespace sectrust;
using namespace sectrust::routing;
using sectrust::crypto::SodiumInterop;

// Built as its own executable: nothing here may initialize libsodium up front.
TEST_CASE("SodiumInterop - Verification initializes libsodium on first use", "[crypto][init]") {
    REQUIRE_FALSE(SodiumInterop::IsInitialized());

    const PublicId stranger(crypto::Ed25519PublicKey{});
    const std::vector<uint8_t> bytes = {'p', 'i', 'n', 'g'};
    REQUIRE_FALSE(stranger.Verify(bytes, crypto::Ed25519Signature{}));

    REQUIRE(SodiumInterop::IsInitialized());
}
