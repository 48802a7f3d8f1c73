#include "sectrust/messages/message.hpp"
#include "sectrust/messages/plain_message.hpp"
#include "sectrust/core/constants.hpp"
#include "sectrust/core/logging.hpp"
#include "sectrust/core/overloaded.hpp"
#include "wire_codec.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace sectrust::routing {

    namespace {
        /// Key the authority's signature was checked against, for logs.
        std::string SigningKeyContext(const SrcAuthority& src) {
            return std::visit(Overloaded{
                [](const NodeAuthority& node) { return node.public_id.ToString(); },
                [](const SectionAuthority& section) {
                    return fmt::format("claimed {}, last key {} ({} keys in proof)",
                                       log::ShortHex(section.signature.ClaimedKey()),
                                       section.proof.LastKey().ToString(), section.proof.Length());
                }
            }, src.GetKind());
        }
    }

    Message::Message(DstLocation dst, SrcAuthority src, Variant variant, std::optional<SectionPublicKey> dst_key)
        : dst_(std::move(dst))
          , src_(std::move(src))
          , variant_(std::move(variant))
          , dst_key_(std::move(dst_key)) {
    }

    Result<Unit, RoutingFailure> Message::Finalize(std::vector<uint8_t> wire_bytes) {
        auto hash = MessageHash::FromBytes(wire_bytes);
        if (hash.IsErr()) {
            return Result<Unit, RoutingFailure>::Err(std::move(hash).UnwrapErr());
        }
        hash_ = hash.Unwrap();
        serialized_ = std::make_shared<const std::vector<uint8_t>>(std::move(wire_bytes));
        return Result<Unit, RoutingFailure>::Ok(unit);
    }

    Result<Message, RoutingFailure> Message::SingleSrc(
        const interfaces::IIdentityProvider& src,
        DstLocation dst,
        std::optional<SectionPublicKey> dst_key,
        Variant variant) {
        auto signed_bytes = SerializeForSigning(dst, dst_key, variant);
        if (signed_bytes.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(signed_bytes).UnwrapErr());
        }
        auto signature = src.Sign(signed_bytes.Unwrap());
        if (signature.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(signature).UnwrapErr());
        }

        Message message(
            std::move(dst),
            SrcAuthority(NodeAuthority{src.GetPublicId(), signature.Unwrap()}),
            std::move(variant),
            std::move(dst_key));
        auto wire_bytes = wire::EncodeMessage(message.dst_, message.src_, message.variant_, message.dst_key_);
        if (wire_bytes.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(wire_bytes).UnwrapErr());
        }
        auto finalized = message.Finalize(std::move(wire_bytes).Unwrap());
        if (finalized.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(finalized).UnwrapErr());
        }
        SECTRUST_LOG_TRACE("Signed {}", message.Summary());
        return Result<Message, RoutingFailure>::Ok(std::move(message));
    }

    Result<Message, RoutingFailure> Message::NewSigned(
        SrcAuthority src,
        DstLocation dst,
        std::optional<SectionPublicKey> dst_key,
        Variant variant) {
        auto signed_bytes = SerializeForSigning(dst, dst_key, variant);
        if (signed_bytes.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(signed_bytes).UnwrapErr());
        }
        auto checked = src.CheckSignature(signed_bytes.Unwrap());
        if (checked.IsErr()) {
            SECTRUST_LOG_WARN("Refusing to build message from {}: {}",
                              src.SrcLocation(), checked.UnwrapErr().message);
            return Result<Message, RoutingFailure>::Err(std::move(checked).UnwrapErr());
        }

        Message message(std::move(dst), std::move(src), std::move(variant), std::move(dst_key));
        auto wire_bytes = wire::EncodeMessage(message.dst_, message.src_, message.variant_, message.dst_key_);
        if (wire_bytes.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(wire_bytes).UnwrapErr());
        }
        auto finalized = message.Finalize(std::move(wire_bytes).Unwrap());
        if (finalized.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(finalized).UnwrapErr());
        }
        return Result<Message, RoutingFailure>::Ok(std::move(message));
    }

    Result<Message, RoutingFailure> Message::FromBytes(
        const std::span<const uint8_t> bytes,
        const configuration::RoutingConfig& config) {
        const size_t limit = std::min(config.max_message_size, RoutingConstants::MAX_MESSAGE_SIZE_LIMIT);
        if (bytes.size() > limit) {
            return Result<Message, RoutingFailure>::Err(
                RoutingFailure::Deserialize(fmt::format(
                    "Message of {} bytes exceeds the limit of {}", bytes.size(), limit)));
        }

        wire::pb::Message proto;
        if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<Message, RoutingFailure>::Err(
                RoutingFailure::Deserialize(std::string(ErrorMessages::PARSE_PROTOBUF_FAILED)));
        }
        if (!proto.has_dst() || !proto.has_src() || !proto.has_variant()) {
            return Result<Message, RoutingFailure>::Err(
                RoutingFailure::Deserialize("Message is missing its destination, source or body"));
        }

        const wire::DecodeLimits limits{config.max_proof_chain_length};
        auto dst = wire::FromProto(proto.dst());
        if (dst.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(dst).UnwrapErr());
        }
        auto src = wire::FromProto(proto.src(), limits);
        if (src.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(src).UnwrapErr());
        }
        auto variant = wire::FromProto(proto.variant(), limits);
        if (variant.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(variant).UnwrapErr());
        }
        std::optional<SectionPublicKey> dst_key;
        if (proto.has_dst_key()) {
            auto key = wire::FromProto(proto.dst_key());
            if (key.IsErr()) {
                return Result<Message, RoutingFailure>::Err(std::move(key).UnwrapErr());
            }
            dst_key = std::move(key).Unwrap();
        }

        Message message(
            std::move(dst).Unwrap(), std::move(src).Unwrap(), std::move(variant).Unwrap(), std::move(dst_key));

        // Accepted bytes are exactly the canonical encoding of what was decoded.
        auto canonical = wire::EncodeMessage(message.dst_, message.src_, message.variant_, message.dst_key_);
        if (canonical.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(canonical).UnwrapErr());
        }
        if (!std::equal(bytes.begin(), bytes.end(), canonical.Unwrap().begin(), canonical.Unwrap().end())) {
            return Result<Message, RoutingFailure>::Err(
                RoutingFailure::Deserialize(std::string(ErrorMessages::NON_CANONICAL_ENCODING)));
        }

        auto signed_bytes = SerializeForSigning(message.dst_, message.dst_key_, message.variant_);
        if (signed_bytes.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(signed_bytes).UnwrapErr());
        }
        auto checked = message.src_.CheckSignature(signed_bytes.Unwrap());
        if (checked.IsErr()) {
            SECTRUST_LOG_ERROR("Rejected {} bytes from {} to {} ({}): {} ({}); signing key: {}",
                               bytes.size(), message.src_.SrcLocation(), message.dst_.ToString(),
                               message.variant_.Name(), ToString(checked.UnwrapErr().type),
                               checked.UnwrapErr().message, SigningKeyContext(message.src_));
            return Result<Message, RoutingFailure>::Err(std::move(checked).UnwrapErr());
        }

        auto finalized = message.Finalize(std::move(canonical).Unwrap());
        if (finalized.IsErr()) {
            return Result<Message, RoutingFailure>::Err(std::move(finalized).UnwrapErr());
        }
        return Result<Message, RoutingFailure>::Ok(std::move(message));
    }

    Result<VerifyStatus, RoutingFailure> Message::Verify(const std::span<const TrustedKey> trusted) const {
        auto status = src_.Verify(dst_, dst_key_, variant_, trusted);
        if (status.IsErr()) {
            LogVerifyFailure(Summary(), status.UnwrapErr(), trusted);
        }
        return status;
    }

    QueuedMessage Message::IntoQueued(std::optional<PeerAddress> sender) && {
        return QueuedMessage{std::move(*this), std::move(sender)};
    }

    std::string Message::Summary() const {
        return fmt::format("Message {{ src: {}, dst: {}, variant: {}, hash: {} }}",
                           src_.SrcLocation(), dst_.ToString(), variant_.Name(),
                           log::ShortHex(hash_.GetBytes()));
    }

    bool Message::operator==(const Message& other) const {
        return hash_ == other.hash_ && *serialized_ == *other.serialized_;
    }

    void LogVerifyFailure(
        const std::string& message_summary,
        const RoutingFailure& failure,
        const std::span<const TrustedKey> trusted) {
        SECTRUST_LOG_ERROR("Verification failed for {}: {} ({}); trusted keys: [{}]",
                           message_summary, ToString(failure.type), failure.message,
                           FormatTrustedKeys(trusted));
    }

}
