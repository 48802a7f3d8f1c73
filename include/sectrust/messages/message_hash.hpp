#pragma once
#include "sectrust/core/constants.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <span>
#include <string>

namespace sectrust::routing {

/**
 * @brief SHA3-256 of a message's exact wire bytes.
 *
 * Identity for deduplication and relay-loop detection only. Never an input
 * to signature verification.
 */
class MessageHash {
public:
    using Bytes = std::array<uint8_t, Constants::MESSAGE_HASH_SIZE>;

    MessageHash() = default;
    explicit MessageHash(const Bytes& bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static Result<MessageHash, RoutingFailure> FromBytes(std::span<const uint8_t> wire_bytes);

    [[nodiscard]] const Bytes& GetBytes() const noexcept { return bytes_; }
    [[nodiscard]] std::string ToHex() const;

    bool operator==(const MessageHash&) const = default;
    auto operator<=>(const MessageHash&) const = default;

private:
    Bytes bytes_{};
};

}

template<>
struct std::hash<sectrust::routing::MessageHash> {
    size_t operator()(const sectrust::routing::MessageHash& hash) const noexcept;
};
