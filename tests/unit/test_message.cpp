#include <catch2/catch_test_macros.hpp>
#include "sectrust/messages/message.hpp"
#include "sectrust/messages/accumulating_message.hpp"
#include "sectrust/messages/plain_message.hpp"
#include "helpers/section_fixture.hpp"
#include <vector>
using namespace sectrust;
using namespace sectrust::routing;
using sectrust::test_helpers::ElderGroup;
using sectrust::test_helpers::NameFromByte;
using sectrust::test_helpers::SectionFixture;

namespace {
    Variant UserPayload(std::vector<uint8_t> content = {1, 2, 3}) {
        return Variant(UserMessage{std::move(content)});
    }
}

TEST_CASE("Message - Single source", "[message]") {
    test_helpers::EnsureSodium();
    const auto node = FullId::Generate().Unwrap();
    const auto dst = DstLocation::ToNode(NameFromByte(0x42));

    SECTION("Construction signs and hashes") {
        auto message = Message::SingleSrc(node, dst, std::nullopt, UserPayload());
        REQUIRE(message.IsOk());
        const auto& m = message.Unwrap();
        REQUIRE(m.Dst() == dst);
        REQUIRE_FALSE(m.DstKey().has_value());
        REQUIRE_FALSE(m.Src().IsSection());
        REQUIRE(m.GetVariant() == UserPayload());
        REQUIRE_FALSE(m.ToBytes().empty());
        REQUIRE(m.Hash() == MessageHash::FromBytes(m.ToBytes()).Unwrap());
    }
    SECTION("Wire round trip preserves every field and the hash") {
        const auto original = Message::SingleSrc(node, dst, std::nullopt, UserPayload()).Unwrap();
        auto decoded = Message::FromBytes(original.ToBytes());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == original);
        REQUIRE(decoded.Unwrap().Hash() == original.Hash());
        REQUIRE(decoded.Unwrap().Src() == original.Src());
        REQUIRE(decoded.Unwrap().ToBytes() == original.ToBytes());
    }
    SECTION("Node messages are Full under any trust table") {
        const auto message = Message::SingleSrc(node, dst, std::nullopt, UserPayload()).Unwrap();
        REQUIRE(message.Verify({}).Unwrap() == VerifyStatus::Full);
        const auto section = SectionFixture::Create(3, 1);
        std::vector<TrustedKey> trusted = {section.TrustAt(0)};
        REQUIRE(message.Verify(trusted).Unwrap() == VerifyStatus::Full);
    }
    SECTION("Different bodies have different hashes") {
        const auto a = Message::SingleSrc(node, dst, std::nullopt, UserPayload({1})).Unwrap();
        const auto b = Message::SingleSrc(node, dst, std::nullopt, UserPayload({2})).Unwrap();
        REQUIRE_FALSE(a.Hash() == b.Hash());
        REQUIRE_FALSE(a == b);
    }
    SECTION("IntoQueued carries the sender") {
        auto message = Message::SingleSrc(node, dst, std::nullopt, Variant(Ping{})).Unwrap();
        const auto hash = message.Hash();
        auto queued = std::move(message).IntoQueued(PeerAddress{"10.0.0.1", 5483});
        REQUIRE(queued.sender.has_value());
        REQUIRE(queued.sender->ToString() == "10.0.0.1:5483");
        REQUIRE(queued.message.Hash() == hash);
    }
}

TEST_CASE("Message - Signing bytes exclude the authority", "[message][signing]") {
    test_helpers::EnsureSodium();
    const auto alice = FullId::Generate().Unwrap();
    const auto bob = FullId::Generate().Unwrap();
    const auto dst = DstLocation::ToSection(NameFromByte(0x10));
    const auto variant = UserPayload({9, 9, 9});

    const auto from_alice = Message::SingleSrc(alice, dst, std::nullopt, variant).Unwrap();
    const auto from_bob = Message::SingleSrc(bob, dst, std::nullopt, variant).Unwrap();

    const auto bytes = SerializeForSigning(dst, std::nullopt, variant).Unwrap();
    const auto& alice_sig = std::get<NodeAuthority>(from_alice.Src().GetKind()).signature;
    const auto& bob_sig = std::get<NodeAuthority>(from_bob.Src().GetKind()).signature;

    REQUIRE(alice.GetPublicId().Verify(bytes, alice_sig));
    REQUIRE(bob.GetPublicId().Verify(bytes, bob_sig));
    REQUIRE_FALSE(from_alice.Hash() == from_bob.Hash());
    REQUIRE(from_alice.Src().CheckSignature(bytes).IsOk());

    SECTION("Swapping the authority onto other content fails") {
        auto forged = Message::NewSigned(
            from_alice.Src(), dst, std::nullopt, UserPayload({0}));
        REQUIRE(forged.IsErr());
        REQUIRE(forged.UnwrapErr().type == RoutingFailureType::FailedSignature);
    }
    SECTION("dst_key is signed") {
        const auto section = SectionFixture::Create(3, 1);
        auto forged = Message::NewSigned(
            from_alice.Src(), dst, section.Current().Key(), variant);
        REQUIRE(forged.IsErr());
    }
}

TEST_CASE("Message - dst_key round trips as present or absent", "[message]") {
    test_helpers::EnsureSodium();
    const auto node = FullId::Generate().Unwrap();
    const auto section = SectionFixture::Create(3, 1);
    const auto dst = DstLocation::ToDirect();

    const auto without = Message::SingleSrc(node, dst, std::nullopt, Variant(Ping{})).Unwrap();
    const auto with = Message::SingleSrc(node, dst, section.Current().Key(), Variant(Ping{})).Unwrap();

    auto decoded_without = Message::FromBytes(without.ToBytes()).Unwrap();
    auto decoded_with = Message::FromBytes(with.ToBytes()).Unwrap();
    REQUIRE_FALSE(decoded_without.DstKey().has_value());
    REQUIRE(decoded_with.DstKey().has_value());
    REQUIRE(*decoded_with.DstKey() == section.Current().Key());
}

TEST_CASE("Message - Every variant round trips", "[message][variant]") {
    test_helpers::EnsureSodium();
    const auto node = FullId::Generate().Unwrap();
    const auto section = SectionFixture::Create(3, 2, Prefix().Pushed(false));

    const auto content = PlainMessage{
        section.prefix, DstLocation::ToPrefix(Prefix().Pushed(true)), std::nullopt, UserPayload()};
    auto share = AccumulatingMessage::Sign(content, section.Chain(), section.Current().ids[0]);
    REQUIRE(share.IsOk());

    const auto bounced = Message::SingleSrc(node, DstLocation::ToDirect(), std::nullopt, Variant(Ping{})).Unwrap();

    std::vector<Variant> variants = {
        UserPayload({}),
        Variant(Ping{}),
        Variant(BootstrapRequest{NameFromByte(0x77)}),
        Variant(BootstrapResponse{BootstrapResponse::Join{
            section.prefix, {section.Current().ids[0].GetPublicId(), section.Current().ids[1].GetPublicId()}}}),
        Variant(BootstrapResponse{BootstrapResponse::Rebootstrap{
            {PeerAddress{"127.0.0.1", 1}, PeerAddress{"::1", 65535}}}}),
        Variant(JoinRequest{section.Current().Key()}),
        Variant(MessageSignature{std::make_shared<const AccumulatingMessage>(share.Unwrap())}),
        Variant(BouncedUntrustedMessage{bounced.ToBytes()}),
    };

    for (const auto& variant : variants) {
        INFO(variant.Name());
        const auto message = Message::SingleSrc(
            node, DstLocation::ToSection(NameFromByte(0x01)), std::nullopt, variant).Unwrap();
        auto decoded = Message::FromBytes(message.ToBytes());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().GetVariant() == variant);
        REQUIRE(decoded.Unwrap().Hash() == message.Hash());
    }
}

TEST_CASE("Message - Summary and status helpers", "[message]") {
    test_helpers::EnsureSodium();
    const auto node = FullId::Generate().Unwrap();
    const auto message = Message::SingleSrc(
        node, DstLocation::ToNode(NameFromByte(0xAB)), std::nullopt, Variant(Ping{})).Unwrap();

    const auto summary = message.Summary();
    REQUIRE(summary.find("Ping") != std::string::npos);
    REQUIRE(summary.find("node PublicId(") != std::string::npos);
    REQUIRE(summary.find("Node(ab000000)") != std::string::npos);

    REQUIRE(RequireFull(VerifyStatus::Full).IsOk());
    auto unknown = RequireFull(VerifyStatus::Unknown);
    REQUIRE(unknown.IsErr());
    REQUIRE(unknown.UnwrapErr().type == RoutingFailureType::UntrustedMessage);
    REQUIRE(ToString(VerifyStatus::Unknown) == "Unknown");
}

TEST_CASE("AccumulatingMessage - Sign", "[message][accumulation]") {
    const auto section = SectionFixture::Create(3, 1);
    const PlainMessage content{section.prefix, DstLocation::ToDirect(), std::nullopt, Variant(Ping{})};

    SECTION("Elders produce verifiable shares") {
        auto share = AccumulatingMessage::Sign(content, section.Chain(), section.Current().ids[1]);
        REQUIRE(share.IsOk());
        const auto bytes = content.SigningBytes().Unwrap();
        REQUIRE(share.Unwrap().Share().signer == section.Current().ids[1].GetPublicId());
        REQUIRE(share.Unwrap().Share().signer.Verify(bytes, share.Unwrap().Share().signature));
    }
    SECTION("Non-elders cannot sign") {
        const auto outsider = FullId::Generate().Unwrap();
        auto share = AccumulatingMessage::Sign(content, section.Chain(), outsider);
        REQUIRE(share.IsErr());
        REQUIRE(share.UnwrapErr().type == RoutingFailureType::InvalidInput);
    }
}
