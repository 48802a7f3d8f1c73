#pragma once
#include "sectrust/identity/public_id.hpp"
#include "sectrust/location/dst_location.hpp"
#include "sectrust/location/prefix.hpp"
#include "sectrust/location/xor_name.hpp"
#include "sectrust/section/section_key.hpp"
#include <cstdint>
#include <memory>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace sectrust::routing {

class AccumulatingMessage;

struct UserMessage {
    std::vector<uint8_t> content;
    bool operator==(const UserMessage&) const = default;
};

struct Ping {
    bool operator==(const Ping&) const = default;
};

struct BootstrapRequest {
    XorName name;
    bool operator==(const BootstrapRequest&) const = default;
};

struct BootstrapResponse {
    /// Join the section with these elders.
    struct Join {
        Prefix prefix;
        std::vector<PublicId> elders;
        bool operator==(const Join&) const = default;
    };
    /// Bootstrap again against these peers.
    struct Rebootstrap {
        std::vector<PeerAddress> peers;
        bool operator==(const Rebootstrap&) const = default;
    };
    std::variant<Join, Rebootstrap> kind;
    bool operator==(const BootstrapResponse&) const = default;
};

struct JoinRequest {
    SectionPublicKey section_key;
    bool operator==(const JoinRequest&) const = default;
};

/// An elder's signature share travelling to the accumulating elder.
struct MessageSignature {
    std::shared_ptr<const AccumulatingMessage> message;
    bool operator==(const MessageSignature& other) const;
};

/// Wire bytes of a message we could not anchor, relayed to a better-informed node.
struct BouncedUntrustedMessage {
    std::vector<uint8_t> message_bytes;
    bool operator==(const BouncedUntrustedMessage&) const = default;
};

/// Message body. A closed set; authentication only sees it as signed content.
class Variant {
public:
    using Kind = std::variant<
        UserMessage,
        Ping,
        BootstrapRequest,
        BootstrapResponse,
        JoinRequest,
        MessageSignature,
        BouncedUntrustedMessage>;

    Variant() : kind_(Ping{}) {}
    template<typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, Variant> &&
                 std::is_constructible_v<Kind, T&&>)
    Variant(T&& kind) : kind_(std::forward<T>(kind)) {}

    [[nodiscard]] const Kind& GetKind() const noexcept { return kind_; }

    template<typename T>
    [[nodiscard]] const T* As() const noexcept { return std::get_if<T>(&kind_); }

    [[nodiscard]] std::string_view Name() const noexcept;

    bool operator==(const Variant&) const = default;

private:
    Kind kind_;
};

}
