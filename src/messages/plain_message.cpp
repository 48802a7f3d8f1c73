#include "sectrust/messages/plain_message.hpp"
#include "wire_codec.hpp"

namespace sectrust::routing {

Result<std::vector<uint8_t>, RoutingFailure> PlainMessage::SigningBytes() const {
    return SerializeForSigning(dst, dst_key, variant);
}

Result<std::vector<uint8_t>, RoutingFailure> SerializeForSigning(
    const DstLocation& dst,
    const std::optional<SectionPublicKey>& dst_key,
    const Variant& variant) {
    return wire::EncodeSignable(dst, dst_key, variant);
}

}
