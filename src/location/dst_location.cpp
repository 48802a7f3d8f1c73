#include "sectrust/location/dst_location.hpp"
#include "sectrust/core/overloaded.hpp"
#include <fmt/core.h>

namespace sectrust::routing {

bool DstLocation::IsSection() const noexcept {
    return std::holds_alternative<Section>(kind_) || std::holds_alternative<PrefixDst>(kind_);
}

std::optional<XorName> DstLocation::NodeName() const noexcept {
    if (const auto* node = std::get_if<Node>(&kind_)) {
        return node->name;
    }
    return std::nullopt;
}

bool DstLocation::Contains(const XorName& name, const Prefix& our_prefix) const noexcept {
    return std::visit(Overloaded{
        [&](const Node& node) { return node.name == name; },
        [&](const Section& section) { return our_prefix.Matches(section.name); },
        [&](const PrefixDst& dst) { return dst.prefix.Matches(name); },
        [](const Direct&) { return true; },
    }, kind_);
}

std::string DstLocation::ToString() const {
    return std::visit(Overloaded{
        [](const Node& node) { return fmt::format("Node({})", node.name.ToHex().substr(0, 8)); },
        [](const Section& section) { return fmt::format("Section({})", section.name.ToHex().substr(0, 8)); },
        [](const PrefixDst& dst) { return fmt::format("Prefix({})", dst.prefix.ToString()); },
        [](const Direct&) { return std::string("Direct"); },
    }, kind_);
}

std::string PeerAddress::ToString() const {
    return fmt::format("{}:{}", ip, port);
}

}
