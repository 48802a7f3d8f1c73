#pragma once
#include "sectrust/core/constants.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include "sectrust/location/dst_location.hpp"
#include "sectrust/location/prefix.hpp"
#include "sectrust/messages/accumulating_message.hpp"
#include "sectrust/messages/plain_message.hpp"
#include "sectrust/messages/src_authority.hpp"
#include "sectrust/messages/variant.hpp"
#include "sectrust/section/proof_chain.hpp"
#include "sectrust/section/section_key.hpp"
#include "sectrust/routing/messages.pb.h"
#include <google/protobuf/message.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace sectrust::routing::wire {

namespace pb = ::sectrust::proto::routing;

/// Limits applied while decoding untrusted input.
struct DecodeLimits {
    size_t max_proof_chain_length = RoutingConstants::DEFAULT_MAX_PROOF_CHAIN_LENGTH;
};

/// Field-order encoding with deterministic map ordering; the only encoding we sign or send.
Result<std::vector<uint8_t>, RoutingFailure> SerializeDeterministic(const google::protobuf::Message& message);

void ToProto(const Prefix& prefix, pb::Prefix* out);
void ToProto(const DstLocation& dst, pb::DstLocation* out);
void ToProto(const PeerAddress& peer, pb::PeerAddress* out);
void ToProto(const SectionPublicKey& key, pb::SectionPublicKey* out);
void ToProto(const SectionSignature& signature, pb::SectionSignature* out);
void ToProto(const ProofChain& chain, pb::ProofChain* out);
void ToProto(const SignatureShare& share, pb::SignatureShare* out);
void ToProto(const SrcAuthority& src, pb::SrcAuthority* out);
Result<Unit, RoutingFailure> ToProto(const Variant& variant, pb::Variant* out);
Result<Unit, RoutingFailure> ToProto(const PlainMessage& content, pb::PlainMessage* out);
Result<Unit, RoutingFailure> ToProto(const AccumulatingMessage& message, pb::AccumulatingMessage* out);

Result<Prefix, RoutingFailure> FromProto(const pb::Prefix& in);
Result<DstLocation, RoutingFailure> FromProto(const pb::DstLocation& in);
Result<PeerAddress, RoutingFailure> FromProto(const pb::PeerAddress& in);
Result<SectionPublicKey, RoutingFailure> FromProto(const pb::SectionPublicKey& in);
Result<SectionSignature, RoutingFailure> FromProto(const pb::SectionSignature& in);
Result<ProofChain, RoutingFailure> FromProto(const pb::ProofChain& in, const DecodeLimits& limits);
Result<SignatureShare, RoutingFailure> FromProto(const pb::SignatureShare& in);
Result<SrcAuthority, RoutingFailure> FromProto(const pb::SrcAuthority& in, const DecodeLimits& limits);
Result<Variant, RoutingFailure> FromProto(const pb::Variant& in, const DecodeLimits& limits);
Result<PlainMessage, RoutingFailure> FromProto(const pb::PlainMessage& in, const DecodeLimits& limits);
Result<AccumulatingMessage, RoutingFailure> FromProto(const pb::AccumulatingMessage& in, const DecodeLimits& limits);

/// Signing bytes: deterministic SignableContent.
Result<std::vector<uint8_t>, RoutingFailure> EncodeSignable(
    const DstLocation& dst,
    const std::optional<SectionPublicKey>& dst_key,
    const Variant& variant);

/// Wire bytes of a whole message.
Result<std::vector<uint8_t>, RoutingFailure> EncodeMessage(
    const DstLocation& dst,
    const SrcAuthority& src,
    const Variant& variant,
    const std::optional<SectionPublicKey>& dst_key);

}
