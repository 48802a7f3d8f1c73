#include "sectrust/messages/message_hash.hpp"
#include "sectrust/crypto/sha3.hpp"
#include "sectrust/core/logging.hpp"
#include <cstring>

namespace sectrust::routing {

Result<MessageHash, RoutingFailure> MessageHash::FromBytes(const std::span<const uint8_t> wire_bytes) {
    auto digest = crypto::Sha3::Digest256(wire_bytes);
    if (digest.IsErr()) {
        return Result<MessageHash, RoutingFailure>::Err(std::move(digest).UnwrapErr());
    }
    return Result<MessageHash, RoutingFailure>::Ok(MessageHash(digest.Unwrap()));
}

std::string MessageHash::ToHex() const {
    return log::ToHex(bytes_);
}

}

size_t std::hash<sectrust::routing::MessageHash>::operator()(
    const sectrust::routing::MessageHash& hash) const noexcept {
    size_t value = 0;
    std::memcpy(&value, hash.GetBytes().data(), sizeof(value));
    return value;
}
