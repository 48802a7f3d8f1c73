#include <catch2/catch_test_macros.hpp>
#include "sectrust/accumulation/signature_accumulator.hpp"
#include "helpers/section_fixture.hpp"
#include <memory>
#include <vector>
using namespace sectrust;
using namespace sectrust::routing;
using sectrust::test_helpers::ElderGroup;
using sectrust::test_helpers::NameFromByte;
using sectrust::test_helpers::SectionFixture;
using sectrust::test_helpers::StaticMembership;

namespace {
    struct AccumulatorContext {
        SectionFixture section;
        std::shared_ptr<StaticMembership> membership;
        std::unique_ptr<SignatureAccumulator> accumulator;
        PlainMessage content;

        static AccumulatorContext Create(size_t elders, size_t generations = 2) {
            AccumulatorContext ctx{
                SectionFixture::Create(elders, generations, Prefix().Pushed(true)),
                nullptr,
                nullptr,
                PlainMessage{}};
            ctx.membership = std::make_shared<StaticMembership>(ctx.section.Info());
            ctx.accumulator = std::make_unique<SignatureAccumulator>(ctx.membership);
            ctx.content = PlainMessage{
                ctx.section.prefix,
                DstLocation::ToSection(NameFromByte(0x33)),
                std::nullopt,
                Variant(UserMessage{{7, 7}})};
            return ctx;
        }

        [[nodiscard]] AccumulatingMessage ShareFrom(size_t elder) const {
            return AccumulatingMessage::Sign(content, section.Chain(), section.Current().ids.at(elder)).Unwrap();
        }
    };
}

TEST_CASE("SignatureAccumulator - Quorum exactness", "[accumulation]") {
    auto ctx = AccumulatorContext::Create(5);
    auto& accumulator = *ctx.accumulator;
    const size_t threshold = ctx.section.Current().Key().Threshold();
    REQUIRE(threshold == 3);

    SECTION("Threshold minus one stays pending") {
        for (size_t i = 0; i + 1 < threshold; ++i) {
            auto outcome = accumulator.AddShare(ctx.ShareFrom(i));
            REQUIRE(outcome.IsOk());
            REQUIRE(outcome.Unwrap().state == AccumulationState::Pending);
            REQUIRE(outcome.Unwrap().collected == i + 1);
            REQUIRE(outcome.Unwrap().threshold == threshold);
        }
        REQUIRE(accumulator.PendingCount() == 1);
        auto attempt = accumulator.TryFinalize(ctx.content);
        REQUIRE(attempt.IsOk());
        REQUIRE(attempt.Unwrap().state == AccumulationState::Pending);
        REQUIRE_FALSE(accumulator.IsFinalized(ctx.content));
    }
    SECTION("The threshold share finalizes a verifiable section message") {
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).IsOk());
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(1)).IsOk());
        auto outcome = accumulator.AddShare(ctx.ShareFrom(2));
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().state == AccumulationState::Finalized);
        REQUIRE(outcome.Unwrap().message.has_value());

        const auto& message = *outcome.Unwrap().message;
        REQUIRE(message.Src().IsSection());
        REQUIRE(message.Dst() == ctx.content.dst);
        REQUIRE(message.GetVariant() == ctx.content.variant);

        std::vector<TrustedKey> trusted = {ctx.section.TrustAt(0)};
        REQUIRE(message.Verify(trusted).Unwrap() == VerifyStatus::Full);
        REQUIRE(Message::FromBytes(message.ToBytes()).IsOk());

        REQUIRE(accumulator.IsFinalized(ctx.content));
        REQUIRE(accumulator.PendingCount() == 0);
    }
    SECTION("Arrival order does not change the signature") {
        auto other = std::make_unique<SignatureAccumulator>(ctx.membership);
        std::optional<Message> forward;
        std::optional<Message> backward;
        for (size_t i : {0u, 1u, 2u}) {
            auto outcome = accumulator.AddShare(ctx.ShareFrom(i)).Unwrap();
            if (outcome.state == AccumulationState::Finalized) {
                forward = std::move(outcome.message);
            }
        }
        for (size_t i : {2u, 0u, 1u}) {
            auto outcome = other->AddShare(ctx.ShareFrom(i)).Unwrap();
            if (outcome.state == AccumulationState::Finalized) {
                backward = std::move(outcome.message);
            }
        }
        REQUIRE(forward.has_value());
        REQUIRE(backward.has_value());
        REQUIRE(forward->Hash() == backward->Hash());
        REQUIRE(*forward == *backward);
    }
}

TEST_CASE("SignatureAccumulator - Duplicates and late shares", "[accumulation]") {
    auto ctx = AccumulatorContext::Create(3);
    auto& accumulator = *ctx.accumulator;

    SECTION("A repeated share is ignored") {
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).Unwrap().state == AccumulationState::Pending);
        auto repeat = accumulator.AddShare(ctx.ShareFrom(0));
        REQUIRE(repeat.IsOk());
        REQUIRE(repeat.Unwrap().state == AccumulationState::Ignored);
        REQUIRE(accumulator.TryFinalize(ctx.content).Unwrap().collected == 1);
    }
    SECTION("Shares after finalization are ignored, repeat finalization is rejected") {
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).IsOk());
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(1)).Unwrap().state == AccumulationState::Finalized);

        REQUIRE(accumulator.AddShare(ctx.ShareFrom(2)).Unwrap().state == AccumulationState::Ignored);
        auto again = accumulator.TryFinalize(ctx.content);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == RoutingFailureType::AlreadyFinalized);
    }
    SECTION("Forget allows the same content to accumulate again") {
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).IsOk());
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(1)).Unwrap().state == AccumulationState::Finalized);
        REQUIRE(accumulator.Forget(ctx.content));
        REQUIRE_FALSE(accumulator.Forget(ctx.content));
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(2)).Unwrap().state == AccumulationState::Pending);
    }
    SECTION("Discard drops pending state") {
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).IsOk());
        REQUIRE(accumulator.Discard(ctx.content));
        REQUIRE(accumulator.PendingCount() == 0);
        REQUIRE_FALSE(accumulator.Discard(ctx.content));
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(1)).Unwrap().state == AccumulationState::Pending);
    }
    SECTION("TryFinalize without shares is pending") {
        auto attempt = accumulator.TryFinalize(ctx.content);
        REQUIRE(attempt.IsOk());
        REQUIRE(attempt.Unwrap().state == AccumulationState::Pending);
        REQUIRE(attempt.Unwrap().collected == 0);
    }
}

TEST_CASE("SignatureAccumulator - Rejected shares", "[accumulation][security]") {
    auto ctx = AccumulatorContext::Create(3);
    auto& accumulator = *ctx.accumulator;

    SECTION("Share from a non-elder") {
        const auto outsider = FullId::Generate().Unwrap();
        const auto bytes = ctx.content.SigningBytes().Unwrap();
        const AccumulatingMessage share(
            ctx.content, ctx.section.Chain(), SignShare(outsider, bytes).Unwrap());
        auto outcome = accumulator.AddShare(share);
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().type == RoutingFailureType::ShareRejected);
        REQUIRE(accumulator.PendingCount() == 0);
    }
    SECTION("Share whose signature does not verify") {
        const auto& elder = ctx.section.Current().ids[0];
        const std::vector<uint8_t> other = {1, 2, 3};
        const AccumulatingMessage share(
            ctx.content, ctx.section.Chain(), SignShare(elder, other).Unwrap());
        auto outcome = accumulator.AddShare(share);
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().type == RoutingFailureType::ShareRejected);
    }
    SECTION("Share from an elder of a previous generation") {
        const auto& former = ctx.section.groups[0].ids[0];
        const auto bytes = ctx.content.SigningBytes().Unwrap();
        const AccumulatingMessage share(
            ctx.content, ctx.section.Chain(), SignShare(former, bytes).Unwrap());
        REQUIRE(accumulator.AddShare(share).IsErr());
    }
    SECTION("Content from another section") {
        auto foreign = ctx.content;
        foreign.src = Prefix().Pushed(false);
        const auto& elder = ctx.section.Current().ids[0];
        const auto bytes = foreign.SigningBytes().Unwrap();
        const AccumulatingMessage share(
            foreign, ctx.section.Chain(), SignShare(elder, bytes).Unwrap());
        auto outcome = accumulator.AddShare(share);
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().type == RoutingFailureType::ShareRejected);
    }
    SECTION("A rejected share does not disturb valid ones") {
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).IsOk());
        const auto outsider = FullId::Generate().Unwrap();
        const auto bytes = ctx.content.SigningBytes().Unwrap();
        const AccumulatingMessage bad(
            ctx.content, ctx.section.Chain(), SignShare(outsider, bytes).Unwrap());
        REQUIRE(accumulator.AddShare(bad).IsErr());
        REQUIRE(accumulator.AddShare(ctx.ShareFrom(1)).Unwrap().state == AccumulationState::Finalized);
    }
}

TEST_CASE("SignatureAccumulator - Membership changes while collecting", "[accumulation][membership]") {
    auto ctx = AccumulatorContext::Create(3);
    auto& accumulator = *ctx.accumulator;
    const auto& elders = ctx.section.Current();

    REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).Unwrap().state == AccumulationState::Pending);

    // Elder 0 leaves: the new key keeps elders 1 and 2 and adds a newcomer.
    const auto newcomer = FullId::Generate().Unwrap();
    auto next_key = SectionPublicKey::Create(
        {elders.ids[1].GetPublicId(), elders.ids[2].GetPublicId(), newcomer.GetPublicId()}, 2).Unwrap();
    auto chain = ctx.section.Chain();
    auto link = SignAsSection(elders.Key(), elders.Quorum(), next_key.ToBytes()).Unwrap();
    REQUIRE(chain.Push(next_key, link).IsOk());
    ctx.membership->Set(SectionInfo{ctx.section.prefix, chain});

    SECTION("The departed elder's share no longer counts") {
        auto outcome = accumulator.AddShare(ctx.ShareFrom(1));
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().state == AccumulationState::Pending);
        REQUIRE(outcome.Unwrap().collected == 1);

        auto final_share = accumulator.AddShare(ctx.ShareFrom(2));
        REQUIRE(final_share.Unwrap().state == AccumulationState::Finalized);
        const auto& message = *final_share.Unwrap().message;
        const auto& authority = std::get<SectionAuthority>(message.Src().GetKind());
        REQUIRE(authority.proof.LastKey() == next_key);
        for (const auto& share : authority.signature.Shares()) {
            REQUIRE_FALSE(next_key.Elders()[share.index] == elders.ids[0].GetPublicId());
        }
    }
    SECTION("A departed elder cannot add shares") {
        const auto bytes = ctx.content.SigningBytes().Unwrap();
        auto late = accumulator.AddShare(AccumulatingMessage(
            ctx.content, chain, SignShare(elders.ids[0], bytes).Unwrap()));
        REQUIRE(late.IsErr());
        REQUIRE(late.UnwrapErr().type == RoutingFailureType::ShareRejected);
    }
}

TEST_CASE("SignatureAccumulator - Proof is minimal for the destination key", "[accumulation][proof]") {
    auto ctx = AccumulatorContext::Create(3, 4);
    auto& accumulator = *ctx.accumulator;
    ctx.content.dst_key = ctx.section.groups[2].Key();

    REQUIRE(accumulator.AddShare(ctx.ShareFrom(0)).IsOk());
    auto outcome = accumulator.AddShare(ctx.ShareFrom(1));
    REQUIRE(outcome.Unwrap().state == AccumulationState::Finalized);

    const auto& message = *outcome.Unwrap().message;
    const auto& authority = std::get<SectionAuthority>(message.Src().GetKind());
    REQUIRE(authority.proof.Length() == 2);
    REQUIRE(authority.proof.FirstKey() == ctx.section.groups[2].Key());
    REQUIRE(message.DstKey() == ctx.section.groups[2].Key());
}
