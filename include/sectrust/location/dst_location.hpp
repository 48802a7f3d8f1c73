#pragma once
#include "sectrust/location/prefix.hpp"
#include "sectrust/location/xor_name.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sectrust::routing {

/// Message destination. Opaque to authentication beyond equality and encoding.
class DstLocation {
public:
    struct Node {
        XorName name;
        bool operator==(const Node&) const = default;
    };
    struct Section {
        XorName name;
        bool operator==(const Section&) const = default;
    };
    struct PrefixDst {
        Prefix prefix;
        bool operator==(const PrefixDst&) const = default;
    };
    /// Direct to the connected peer, with no routing.
    struct Direct {
        bool operator==(const Direct&) const = default;
    };
    using Kind = std::variant<Node, Section, PrefixDst, Direct>;

    DstLocation() : kind_(Direct{}) {}
    explicit DstLocation(Kind kind) : kind_(std::move(kind)) {}

    [[nodiscard]] static DstLocation ToNode(const XorName& name) { return DstLocation(Node{name}); }
    [[nodiscard]] static DstLocation ToSection(const XorName& name) { return DstLocation(Section{name}); }
    [[nodiscard]] static DstLocation ToPrefix(const Prefix& prefix) { return DstLocation(PrefixDst{prefix}); }
    [[nodiscard]] static DstLocation ToDirect() { return DstLocation(Direct{}); }

    [[nodiscard]] const Kind& GetKind() const noexcept { return kind_; }

    [[nodiscard]] bool IsSection() const noexcept;

    /// Name of a single node destination, if that is what this is.
    [[nodiscard]] std::optional<XorName> NodeName() const noexcept;

    /**
     * @brief Whether `name` is one of the destinations.
     *
     * `our_prefix` is the prefix of the section `name` belongs to; a section
     * destination covers every member of the section matching it.
     */
    [[nodiscard]] bool Contains(const XorName& name, const Prefix& our_prefix) const noexcept;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const DstLocation&) const = default;

private:
    Kind kind_;
};

/// Transport-level address of the peer a message arrived from.
struct PeerAddress {
    std::string ip;
    uint16_t port = 0;

    [[nodiscard]] std::string ToString() const;
    bool operator==(const PeerAddress&) const = default;
};

}
