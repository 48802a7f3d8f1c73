#include "wire_codec.hpp"
#include "sectrust/core/overloaded.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <fmt/core.h>
#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace sectrust::routing::wire {

    namespace {
        template<typename T>
        Result<T, RoutingFailure> Malformed(std::string message) {
            return Result<T, RoutingFailure>::Err(RoutingFailure::Deserialize(std::move(message)));
        }

        template<size_t N>
        Result<std::array<uint8_t, N>, RoutingFailure> FixedBytes(
            const std::string& in,
            const std::string_view field) {
            if (in.size() != N) {
                return Malformed<std::array<uint8_t, N>>(
                    fmt::format("Field '{}' must be {} bytes, got {}", field, N, in.size()));
            }
            std::array<uint8_t, N> out{};
            std::copy(in.begin(), in.end(), out.begin());
            return Result<std::array<uint8_t, N>, RoutingFailure>::Ok(out);
        }

        template<size_t N>
        std::string AsString(const std::array<uint8_t, N>& bytes) {
            return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }

        Result<XorName, RoutingFailure> NameFromProto(const std::string& in, const std::string_view field) {
            auto bytes = FixedBytes<Constants::XOR_NAME_SIZE>(in, field);
            if (bytes.IsErr()) {
                return Result<XorName, RoutingFailure>::Err(std::move(bytes).UnwrapErr());
            }
            return Result<XorName, RoutingFailure>::Ok(XorName(bytes.Unwrap()));
        }

        Result<PublicId, RoutingFailure> PublicIdFromProto(const std::string& in, const std::string_view field) {
            auto key = FixedBytes<Constants::ED_25519_PUBLIC_KEY_SIZE>(in, field);
            if (key.IsErr()) {
                return Result<PublicId, RoutingFailure>::Err(std::move(key).UnwrapErr());
            }
            return Result<PublicId, RoutingFailure>::Ok(PublicId(key.Unwrap()));
        }
    }

    Result<std::vector<uint8_t>, RoutingFailure> SerializeDeterministic(const google::protobuf::Message& message) {
        std::string output;
        {
            google::protobuf::io::StringOutputStream stream(&output);
            google::protobuf::io::CodedOutputStream coded_out(&stream);
            coded_out.SetSerializationDeterministic(true);
            if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                return Result<std::vector<uint8_t>, RoutingFailure>::Err(
                    RoutingFailure::Serialize(std::string(ErrorMessages::SERIALIZE_PROTOBUF_FAILED)));
            }
        }
        return Result<std::vector<uint8_t>, RoutingFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }

    // ---- encode -------------------------------------------------------------

    void ToProto(const Prefix& prefix, pb::Prefix* out) {
        out->set_bit_count(prefix.BitCount());
        out->set_name(AsString(prefix.Name().GetBytes()));
    }

    void ToProto(const DstLocation& dst, pb::DstLocation* out) {
        std::visit(Overloaded{
            [out](const DstLocation::Node& node) { out->set_node(AsString(node.name.GetBytes())); },
            [out](const DstLocation::Section& section) { out->set_section(AsString(section.name.GetBytes())); },
            [out](const DstLocation::PrefixDst& prefix) { ToProto(prefix.prefix, out->mutable_prefix()); },
            [out](const DstLocation::Direct&) { out->mutable_direct(); }
        }, dst.GetKind());
    }

    void ToProto(const PeerAddress& peer, pb::PeerAddress* out) {
        out->set_ip(peer.ip);
        out->set_port(peer.port);
    }

    void ToProto(const SectionPublicKey& key, pb::SectionPublicKey* out) {
        out->set_threshold(static_cast<uint32_t>(key.Threshold()));
        for (const auto& elder : key.Elders()) {
            out->add_elders(AsString(elder.GetPublicKey()));
        }
    }

    void ToProto(const SectionSignature& signature, pb::SectionSignature* out) {
        out->set_key_digest(AsString(signature.ClaimedKey()));
        for (const auto& share : signature.Shares()) {
            auto* entry = out->add_shares();
            entry->set_index(share.index);
            entry->set_signature(AsString(share.signature));
        }
    }

    void ToProto(const ProofChain& chain, pb::ProofChain* out) {
        ToProto(chain.FirstKey(), out->mutable_first_key());
        for (const auto& block : chain.Blocks()) {
            auto* entry = out->add_blocks();
            ToProto(block.key, entry->mutable_key());
            ToProto(block.signature, entry->mutable_signature());
        }
    }

    void ToProto(const SignatureShare& share, pb::SignatureShare* out) {
        out->set_signer(AsString(share.signer.GetPublicKey()));
        out->set_signature(AsString(share.signature));
    }

    void ToProto(const SrcAuthority& src, pb::SrcAuthority* out) {
        std::visit(Overloaded{
            [out](const NodeAuthority& node) {
                auto* entry = out->mutable_node();
                entry->set_public_key(AsString(node.public_id.GetPublicKey()));
                entry->set_signature(AsString(node.signature));
            },
            [out](const SectionAuthority& section) {
                auto* entry = out->mutable_section();
                ToProto(section.prefix, entry->mutable_prefix());
                ToProto(section.signature, entry->mutable_signature());
                ToProto(section.proof, entry->mutable_proof());
            }
        }, src.GetKind());
    }

    Result<Unit, RoutingFailure> ToProto(const Variant& variant, pb::Variant* out) {
        const auto& kind = variant.GetKind();
        if (const auto* user = std::get_if<UserMessage>(&kind)) {
            out->mutable_user_message()->set_content(
                std::string(reinterpret_cast<const char*>(user->content.data()), user->content.size()));
        } else if (std::holds_alternative<Ping>(kind)) {
            out->mutable_ping();
        } else if (const auto* request = std::get_if<BootstrapRequest>(&kind)) {
            out->mutable_bootstrap_request()->set_name(AsString(request->name.GetBytes()));
        } else if (const auto* response = std::get_if<BootstrapResponse>(&kind)) {
            auto* entry = out->mutable_bootstrap_response();
            if (const auto* join = std::get_if<BootstrapResponse::Join>(&response->kind)) {
                auto* join_out = entry->mutable_join();
                ToProto(join->prefix, join_out->mutable_prefix());
                for (const auto& elder : join->elders) {
                    join_out->add_elders(AsString(elder.GetPublicKey()));
                }
            } else {
                auto* rebootstrap_out = entry->mutable_rebootstrap();
                for (const auto& peer : std::get<BootstrapResponse::Rebootstrap>(response->kind).peers) {
                    ToProto(peer, rebootstrap_out->add_peers());
                }
            }
        } else if (const auto* join_request = std::get_if<JoinRequest>(&kind)) {
            ToProto(join_request->section_key, out->mutable_join_request()->mutable_section_key());
        } else if (const auto* signature = std::get_if<MessageSignature>(&kind)) {
            if (!signature->message) {
                return Result<Unit, RoutingFailure>::Err(
                    RoutingFailure::Serialize("MessageSignature carries no accumulating message"));
            }
            return ToProto(*signature->message, out->mutable_message_signature());
        } else {
            const auto& bounced = std::get<BouncedUntrustedMessage>(kind);
            out->mutable_bounced_untrusted_message()->set_message(
                std::string(reinterpret_cast<const char*>(bounced.message_bytes.data()),
                            bounced.message_bytes.size()));
        }
        return Result<Unit, RoutingFailure>::Ok(unit);
    }

    Result<Unit, RoutingFailure> ToProto(const PlainMessage& content, pb::PlainMessage* out) {
        ToProto(content.src, out->mutable_src());
        ToProto(content.dst, out->mutable_dst());
        if (content.dst_key.has_value()) {
            ToProto(*content.dst_key, out->mutable_dst_key());
        }
        return ToProto(content.variant, out->mutable_variant());
    }

    Result<Unit, RoutingFailure> ToProto(const AccumulatingMessage& message, pb::AccumulatingMessage* out) {
        auto content = ToProto(message.Content(), out->mutable_content());
        if (content.IsErr()) {
            return content;
        }
        ToProto(message.Proof(), out->mutable_proof());
        ToProto(message.Share(), out->mutable_share());
        return Result<Unit, RoutingFailure>::Ok(unit);
    }

    // ---- decode -------------------------------------------------------------

    Result<Prefix, RoutingFailure> FromProto(const pb::Prefix& in) {
        if (in.bit_count() > Constants::XOR_NAME_BITS) {
            return Malformed<Prefix>(fmt::format("Prefix of {} bits is longer than a name", in.bit_count()));
        }
        auto name = NameFromProto(in.name(), "prefix.name");
        if (name.IsErr()) {
            return Result<Prefix, RoutingFailure>::Err(std::move(name).UnwrapErr());
        }
        return Result<Prefix, RoutingFailure>::Ok(
            Prefix(static_cast<uint16_t>(in.bit_count()), name.Unwrap()));
    }

    Result<DstLocation, RoutingFailure> FromProto(const pb::DstLocation& in) {
        switch (in.kind_case()) {
            case pb::DstLocation::kNode: {
                auto name = NameFromProto(in.node(), "dst.node");
                if (name.IsErr()) {
                    return Result<DstLocation, RoutingFailure>::Err(std::move(name).UnwrapErr());
                }
                return Result<DstLocation, RoutingFailure>::Ok(DstLocation::ToNode(name.Unwrap()));
            }
            case pb::DstLocation::kSection: {
                auto name = NameFromProto(in.section(), "dst.section");
                if (name.IsErr()) {
                    return Result<DstLocation, RoutingFailure>::Err(std::move(name).UnwrapErr());
                }
                return Result<DstLocation, RoutingFailure>::Ok(DstLocation::ToSection(name.Unwrap()));
            }
            case pb::DstLocation::kPrefix: {
                auto prefix = FromProto(in.prefix());
                if (prefix.IsErr()) {
                    return Result<DstLocation, RoutingFailure>::Err(std::move(prefix).UnwrapErr());
                }
                return Result<DstLocation, RoutingFailure>::Ok(DstLocation::ToPrefix(prefix.Unwrap()));
            }
            case pb::DstLocation::kDirect:
                return Result<DstLocation, RoutingFailure>::Ok(DstLocation::ToDirect());
            case pb::DstLocation::KIND_NOT_SET:
                break;
        }
        return Malformed<DstLocation>("Destination kind not set");
    }

    Result<PeerAddress, RoutingFailure> FromProto(const pb::PeerAddress& in) {
        if (in.port() > UINT16_MAX) {
            return Malformed<PeerAddress>(fmt::format("Port {} out of range", in.port()));
        }
        return Result<PeerAddress, RoutingFailure>::Ok(
            PeerAddress{in.ip(), static_cast<uint16_t>(in.port())});
    }

    Result<SectionPublicKey, RoutingFailure> FromProto(const pb::SectionPublicKey& in) {
        std::vector<PublicId> elders;
        elders.reserve(static_cast<size_t>(in.elders_size()));
        for (const auto& elder : in.elders()) {
            auto id = PublicIdFromProto(elder, "section_key.elders");
            if (id.IsErr()) {
                return Result<SectionPublicKey, RoutingFailure>::Err(std::move(id).UnwrapErr());
            }
            elders.push_back(id.Unwrap());
        }
        auto key = SectionPublicKey::Create(std::move(elders), in.threshold());
        if (key.IsErr()) {
            return Malformed<SectionPublicKey>("Invalid section key: " + key.UnwrapErr().message);
        }
        return key;
    }

    Result<SectionSignature, RoutingFailure> FromProto(const pb::SectionSignature& in) {
        auto digest = FixedBytes<Constants::KEY_DIGEST_SIZE>(in.key_digest(), "signature.key_digest");
        if (digest.IsErr()) {
            return Result<SectionSignature, RoutingFailure>::Err(std::move(digest).UnwrapErr());
        }
        std::vector<SectionSignature::IndexedShare> shares;
        shares.reserve(static_cast<size_t>(in.shares_size()));
        for (const auto& share : in.shares()) {
            auto signature = FixedBytes<Constants::ED_25519_SIGNATURE_SIZE>(share.signature(), "signature.shares");
            if (signature.IsErr()) {
                return Result<SectionSignature, RoutingFailure>::Err(std::move(signature).UnwrapErr());
            }
            shares.push_back(SectionSignature::IndexedShare{share.index(), signature.Unwrap()});
        }
        return Result<SectionSignature, RoutingFailure>::Ok(
            SectionSignature(digest.Unwrap(), std::move(shares)));
    }

    Result<ProofChain, RoutingFailure> FromProto(const pb::ProofChain& in, const DecodeLimits& limits) {
        if (!in.has_first_key()) {
            return Malformed<ProofChain>("Proof chain has no first key");
        }
        const size_t length = static_cast<size_t>(in.blocks_size()) + 1;
        if (length > limits.max_proof_chain_length) {
            return Malformed<ProofChain>(fmt::format(
                "Proof chain of {} keys exceeds the limit of {}", length, limits.max_proof_chain_length));
        }
        auto first_key = FromProto(in.first_key());
        if (first_key.IsErr()) {
            return Result<ProofChain, RoutingFailure>::Err(std::move(first_key).UnwrapErr());
        }
        std::vector<ProofBlock> blocks;
        blocks.reserve(static_cast<size_t>(in.blocks_size()));
        for (const auto& block : in.blocks()) {
            if (!block.has_key() || !block.has_signature()) {
                return Malformed<ProofChain>("Proof block is missing its key or signature");
            }
            auto key = FromProto(block.key());
            if (key.IsErr()) {
                return Result<ProofChain, RoutingFailure>::Err(std::move(key).UnwrapErr());
            }
            auto signature = FromProto(block.signature());
            if (signature.IsErr()) {
                return Result<ProofChain, RoutingFailure>::Err(std::move(signature).UnwrapErr());
            }
            blocks.push_back(ProofBlock{std::move(key).Unwrap(), std::move(signature).Unwrap()});
        }
        return Result<ProofChain, RoutingFailure>::Ok(
            ProofChain::FromParts(std::move(first_key).Unwrap(), std::move(blocks)));
    }

    Result<SignatureShare, RoutingFailure> FromProto(const pb::SignatureShare& in) {
        auto signer = PublicIdFromProto(in.signer(), "share.signer");
        if (signer.IsErr()) {
            return Result<SignatureShare, RoutingFailure>::Err(std::move(signer).UnwrapErr());
        }
        auto signature = FixedBytes<Constants::ED_25519_SIGNATURE_SIZE>(in.signature(), "share.signature");
        if (signature.IsErr()) {
            return Result<SignatureShare, RoutingFailure>::Err(std::move(signature).UnwrapErr());
        }
        return Result<SignatureShare, RoutingFailure>::Ok(SignatureShare{signer.Unwrap(), signature.Unwrap()});
    }

    Result<SrcAuthority, RoutingFailure> FromProto(const pb::SrcAuthority& in, const DecodeLimits& limits) {
        if (in.has_node()) {
            auto public_id = PublicIdFromProto(in.node().public_key(), "src.node.public_key");
            if (public_id.IsErr()) {
                return Result<SrcAuthority, RoutingFailure>::Err(std::move(public_id).UnwrapErr());
            }
            auto signature = FixedBytes<Constants::ED_25519_SIGNATURE_SIZE>(
                in.node().signature(), "src.node.signature");
            if (signature.IsErr()) {
                return Result<SrcAuthority, RoutingFailure>::Err(std::move(signature).UnwrapErr());
            }
            return Result<SrcAuthority, RoutingFailure>::Ok(
                SrcAuthority(NodeAuthority{public_id.Unwrap(), signature.Unwrap()}));
        }
        if (!in.has_section()) {
            return Malformed<SrcAuthority>("Source authority kind not set");
        }
        const auto& section = in.section();
        if (!section.has_prefix() || !section.has_signature() || !section.has_proof()) {
            return Malformed<SrcAuthority>("Section authority is missing a field");
        }
        auto prefix = FromProto(section.prefix());
        if (prefix.IsErr()) {
            return Result<SrcAuthority, RoutingFailure>::Err(std::move(prefix).UnwrapErr());
        }
        auto signature = FromProto(section.signature());
        if (signature.IsErr()) {
            return Result<SrcAuthority, RoutingFailure>::Err(std::move(signature).UnwrapErr());
        }
        auto proof = FromProto(section.proof(), limits);
        if (proof.IsErr()) {
            return Result<SrcAuthority, RoutingFailure>::Err(std::move(proof).UnwrapErr());
        }
        return Result<SrcAuthority, RoutingFailure>::Ok(SrcAuthority(SectionAuthority{
            prefix.Unwrap(), std::move(signature).Unwrap(), std::move(proof).Unwrap()}));
    }

    Result<Variant, RoutingFailure> FromProto(const pb::Variant& in, const DecodeLimits& limits) {
        switch (in.kind_case()) {
            case pb::Variant::kUserMessage: {
                const auto& content = in.user_message().content();
                return Result<Variant, RoutingFailure>::Ok(
                    Variant(UserMessage{std::vector<uint8_t>(content.begin(), content.end())}));
            }
            case pb::Variant::kPing:
                return Result<Variant, RoutingFailure>::Ok(Variant(Ping{}));
            case pb::Variant::kBootstrapRequest: {
                auto name = NameFromProto(in.bootstrap_request().name(), "bootstrap_request.name");
                if (name.IsErr()) {
                    return Result<Variant, RoutingFailure>::Err(std::move(name).UnwrapErr());
                }
                return Result<Variant, RoutingFailure>::Ok(Variant(BootstrapRequest{name.Unwrap()}));
            }
            case pb::Variant::kBootstrapResponse: {
                const auto& response = in.bootstrap_response();
                if (response.has_join()) {
                    auto prefix = FromProto(response.join().prefix());
                    if (prefix.IsErr()) {
                        return Result<Variant, RoutingFailure>::Err(std::move(prefix).UnwrapErr());
                    }
                    BootstrapResponse::Join join{prefix.Unwrap(), {}};
                    for (const auto& elder : response.join().elders()) {
                        auto id = PublicIdFromProto(elder, "bootstrap_response.join.elders");
                        if (id.IsErr()) {
                            return Result<Variant, RoutingFailure>::Err(std::move(id).UnwrapErr());
                        }
                        join.elders.push_back(id.Unwrap());
                    }
                    return Result<Variant, RoutingFailure>::Ok(Variant(BootstrapResponse{std::move(join)}));
                }
                if (!response.has_rebootstrap()) {
                    return Malformed<Variant>("Bootstrap response kind not set");
                }
                BootstrapResponse::Rebootstrap rebootstrap;
                for (const auto& peer : response.rebootstrap().peers()) {
                    auto address = FromProto(peer);
                    if (address.IsErr()) {
                        return Result<Variant, RoutingFailure>::Err(std::move(address).UnwrapErr());
                    }
                    rebootstrap.peers.push_back(std::move(address).Unwrap());
                }
                return Result<Variant, RoutingFailure>::Ok(Variant(BootstrapResponse{std::move(rebootstrap)}));
            }
            case pb::Variant::kJoinRequest: {
                if (!in.join_request().has_section_key()) {
                    return Malformed<Variant>("Join request has no section key");
                }
                auto key = FromProto(in.join_request().section_key());
                if (key.IsErr()) {
                    return Result<Variant, RoutingFailure>::Err(std::move(key).UnwrapErr());
                }
                return Result<Variant, RoutingFailure>::Ok(Variant(JoinRequest{std::move(key).Unwrap()}));
            }
            case pb::Variant::kMessageSignature: {
                auto message = FromProto(in.message_signature(), limits);
                if (message.IsErr()) {
                    return Result<Variant, RoutingFailure>::Err(std::move(message).UnwrapErr());
                }
                return Result<Variant, RoutingFailure>::Ok(Variant(MessageSignature{
                    std::make_shared<const AccumulatingMessage>(std::move(message).Unwrap())}));
            }
            case pb::Variant::kBouncedUntrustedMessage: {
                const auto& bytes = in.bounced_untrusted_message().message();
                return Result<Variant, RoutingFailure>::Ok(
                    Variant(BouncedUntrustedMessage{std::vector<uint8_t>(bytes.begin(), bytes.end())}));
            }
            case pb::Variant::KIND_NOT_SET:
                break;
        }
        return Malformed<Variant>("Message variant not set");
    }

    Result<PlainMessage, RoutingFailure> FromProto(const pb::PlainMessage& in, const DecodeLimits& limits) {
        if (!in.has_src() || !in.has_dst() || !in.has_variant()) {
            return Malformed<PlainMessage>("Plain message is missing a field");
        }
        auto src = FromProto(in.src());
        if (src.IsErr()) {
            return Result<PlainMessage, RoutingFailure>::Err(std::move(src).UnwrapErr());
        }
        auto dst = FromProto(in.dst());
        if (dst.IsErr()) {
            return Result<PlainMessage, RoutingFailure>::Err(std::move(dst).UnwrapErr());
        }
        std::optional<SectionPublicKey> dst_key;
        if (in.has_dst_key()) {
            auto key = FromProto(in.dst_key());
            if (key.IsErr()) {
                return Result<PlainMessage, RoutingFailure>::Err(std::move(key).UnwrapErr());
            }
            dst_key = std::move(key).Unwrap();
        }
        auto variant = FromProto(in.variant(), limits);
        if (variant.IsErr()) {
            return Result<PlainMessage, RoutingFailure>::Err(std::move(variant).UnwrapErr());
        }
        return Result<PlainMessage, RoutingFailure>::Ok(PlainMessage{
            src.Unwrap(), std::move(dst).Unwrap(), std::move(dst_key), std::move(variant).Unwrap()});
    }

    Result<AccumulatingMessage, RoutingFailure> FromProto(
        const pb::AccumulatingMessage& in,
        const DecodeLimits& limits) {
        if (!in.has_content() || !in.has_proof() || !in.has_share()) {
            return Malformed<AccumulatingMessage>("Accumulating message is missing a field");
        }
        auto content = FromProto(in.content(), limits);
        if (content.IsErr()) {
            return Result<AccumulatingMessage, RoutingFailure>::Err(std::move(content).UnwrapErr());
        }
        auto proof = FromProto(in.proof(), limits);
        if (proof.IsErr()) {
            return Result<AccumulatingMessage, RoutingFailure>::Err(std::move(proof).UnwrapErr());
        }
        auto share = FromProto(in.share());
        if (share.IsErr()) {
            return Result<AccumulatingMessage, RoutingFailure>::Err(std::move(share).UnwrapErr());
        }
        return Result<AccumulatingMessage, RoutingFailure>::Ok(AccumulatingMessage(
            std::move(content).Unwrap(), std::move(proof).Unwrap(), std::move(share).Unwrap()));
    }

    Result<std::vector<uint8_t>, RoutingFailure> EncodeSignable(
        const DstLocation& dst,
        const std::optional<SectionPublicKey>& dst_key,
        const Variant& variant) {
        pb::SignableContent content;
        ToProto(dst, content.mutable_dst());
        if (dst_key.has_value()) {
            ToProto(*dst_key, content.mutable_dst_key());
        }
        auto encoded = ToProto(variant, content.mutable_variant());
        if (encoded.IsErr()) {
            return Result<std::vector<uint8_t>, RoutingFailure>::Err(std::move(encoded).UnwrapErr());
        }
        return SerializeDeterministic(content);
    }

    Result<std::vector<uint8_t>, RoutingFailure> EncodeMessage(
        const DstLocation& dst,
        const SrcAuthority& src,
        const Variant& variant,
        const std::optional<SectionPublicKey>& dst_key) {
        pb::Message message;
        ToProto(dst, message.mutable_dst());
        ToProto(src, message.mutable_src());
        auto encoded = ToProto(variant, message.mutable_variant());
        if (encoded.IsErr()) {
            return Result<std::vector<uint8_t>, RoutingFailure>::Err(std::move(encoded).UnwrapErr());
        }
        if (dst_key.has_value()) {
            ToProto(*dst_key, message.mutable_dst_key());
        }
        return SerializeDeterministic(message);
    }

}
