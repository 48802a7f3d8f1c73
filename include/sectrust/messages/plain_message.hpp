#pragma once
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include "sectrust/location/dst_location.hpp"
#include "sectrust/location/prefix.hpp"
#include "sectrust/messages/variant.hpp"
#include "sectrust/section/section_key.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace sectrust::routing {

/// The content a section's elders agree to sign, before any signature exists.
struct PlainMessage {
    /// Prefix of the signing section.
    Prefix src;
    DstLocation dst;
    std::optional<SectionPublicKey> dst_key;
    Variant variant;

    [[nodiscard]] Result<std::vector<uint8_t>, RoutingFailure> SigningBytes() const;

    bool operator==(const PlainMessage&) const = default;
};

/**
 * @brief Canonical bytes an authority signs.
 *
 * Deterministic encoding of (dst, dst_key, variant). The authority and the
 * cached wire bytes are excluded.
 */
[[nodiscard]] Result<std::vector<uint8_t>, RoutingFailure> SerializeForSigning(
    const DstLocation& dst,
    const std::optional<SectionPublicKey>& dst_key,
    const Variant& variant);

}
