#include <catch2/catch_test_macros.hpp>
#include "sectrust/section/section_key.hpp"
#include "helpers/section_fixture.hpp"
#include <algorithm>
#include <vector>
using namespace sectrust;
using namespace sectrust::routing;
using sectrust::test_helpers::ElderGroup;

namespace {
    std::vector<uint8_t> Payload() {
        return {'c', 'o', 'l', 'l', 'e', 'c', 't', 'i', 'v', 'e'};
    }

    std::vector<SignatureShare> ShareAll(const ElderGroup& group, const std::vector<uint8_t>& bytes) {
        std::vector<SignatureShare> shares;
        for (const auto& id : group.ids) {
            shares.push_back(SignShare(id, bytes).Unwrap());
        }
        return shares;
    }
}

TEST_CASE("SectionPublicKey - Creation", "[section][key]") {
    const auto group = ElderGroup::Create(5);

    SECTION("Elders are sorted and the threshold is a majority") {
        const auto& key = group.Key();
        REQUIRE(key.Size() == 5);
        REQUIRE(key.Threshold() == 3);
        REQUIRE(std::is_sorted(key.Elders().begin(), key.Elders().end()));
        for (const auto& id : group.ids) {
            REQUIRE(key.Contains(id.GetPublicId()));
        }
    }
    SECTION("Elder order does not change the key") {
        std::vector<PublicId> reversed(group.Key().Elders().rbegin(), group.Key().Elders().rend());
        auto again = SectionPublicKey::Create(reversed, 3);
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap() == group.Key());
        REQUIRE(again.Unwrap().Digest() == group.Key().Digest());
    }
    SECTION("Threshold is part of the key") {
        auto other = SectionPublicKey::Create(group.Key().Elders(), 4).Unwrap();
        REQUIRE_FALSE(other == group.Key());
        REQUIRE(other.Digest() != group.Key().Digest());
    }
    SECTION("Invalid shapes are rejected") {
        REQUIRE(SectionPublicKey::Create({}, 1).IsErr());
        REQUIRE(SectionPublicKey::Create(group.Key().Elders(), 0).IsErr());
        REQUIRE(SectionPublicKey::Create(group.Key().Elders(), 6).IsErr());
        auto duplicated = group.Key().Elders();
        duplicated.push_back(duplicated.front());
        auto result = SectionPublicKey::Create(duplicated, 2);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RoutingFailureType::InvalidInput);
    }
}

TEST_CASE("SectionSignature - Combine and verify", "[section][key]") {
    const auto group = ElderGroup::Create(5);
    const auto& key = group.Key();
    const auto bytes = Payload();
    const auto shares = ShareAll(group, bytes);

    SECTION("Threshold shares verify") {
        auto signature = SectionSignature::Combine(key, std::span(shares).first(3));
        REQUIRE(signature.IsOk());
        REQUIRE(signature.Unwrap().Shares().size() == 3);
        REQUIRE(key.Verify(bytes, signature.Unwrap()));
    }
    SECTION("Below threshold does not combine") {
        auto signature = SectionSignature::Combine(key, std::span(shares).first(2));
        REQUIRE(signature.IsErr());
        REQUIRE(signature.UnwrapErr().type == RoutingFailureType::QuorumNotReached);
    }
    SECTION("Repeated signer counts once") {
        std::vector<SignatureShare> repeated = {shares[0], shares[0], shares[0], shares[1]};
        REQUIRE(SectionSignature::Combine(key, repeated).IsErr());
    }
    SECTION("Result is independent of share order") {
        std::vector<SignatureShare> reversed(shares.rbegin(), shares.rend());
        auto forward = SectionSignature::Combine(key, shares).Unwrap();
        auto backward = SectionSignature::Combine(key, reversed).Unwrap();
        REQUIRE(forward == backward);
    }
    SECTION("Different content does not verify") {
        auto signature = SectionSignature::Combine(key, shares).Unwrap();
        auto other = bytes;
        other.back() ^= 0x01;
        REQUIRE_FALSE(key.Verify(other, signature));
    }
    SECTION("Signature under another key does not verify") {
        const auto stranger = ElderGroup::Create(5);
        auto signature = SectionSignature::Combine(stranger.Key(), ShareAll(stranger, bytes)).Unwrap();
        REQUIRE(stranger.Key().Verify(bytes, signature));
        REQUIRE_FALSE(key.Verify(bytes, signature));
    }
    SECTION("Forged share structure is rejected") {
        auto signature = SectionSignature::Combine(key, shares).Unwrap();
        auto indexed = signature.Shares();

        auto duplicated = indexed;
        duplicated[1] = duplicated[0];
        REQUIRE_FALSE(key.Verify(bytes, SectionSignature(key.Digest(), duplicated)));

        auto truncated = indexed;
        truncated.pop_back();
        REQUIRE_FALSE(key.Verify(bytes, SectionSignature(key.Digest(), truncated)));

        auto out_of_range = indexed;
        out_of_range.back().index = 99;
        REQUIRE_FALSE(key.Verify(bytes, SectionSignature(key.Digest(), out_of_range)));
    }
    SECTION("SignAsSection with a quorum") {
        auto signature = SignAsSection(key, group.Quorum(), bytes);
        REQUIRE(signature.IsOk());
        REQUIRE(key.Verify(bytes, signature.Unwrap()));
    }
}

TEST_CASE("SectionSignature - Shares are domain separated from node signatures", "[section][key][security]") {
    const auto group = ElderGroup::Create(3);
    const auto& key = group.Key();
    const auto bytes = Payload();
    const auto& elder = group.ids[0];

    SECTION("A node signature is not a share") {
        const SignatureShare lifted{elder.GetPublicId(), elder.Sign(bytes).Unwrap()};
        REQUIRE_FALSE(VerifyShare(lifted, bytes));
    }
    SECTION("A share is not a node signature") {
        const auto share = SignShare(elder, bytes).Unwrap();
        REQUIRE(VerifyShare(share, bytes));
        REQUIRE_FALSE(elder.GetPublicId().Verify(bytes, share.signature));
    }
    SECTION("Combined node signatures do not verify under the section key") {
        std::vector<SignatureShare> lifted;
        for (const auto& id : group.ids) {
            lifted.push_back(SignatureShare{id.GetPublicId(), id.Sign(bytes).Unwrap()});
        }
        auto signature = SectionSignature::Combine(key, lifted);
        REQUIRE(signature.IsOk());
        REQUIRE_FALSE(key.Verify(bytes, signature.Unwrap()));
    }
}
