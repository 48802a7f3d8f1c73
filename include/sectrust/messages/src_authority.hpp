#pragma once
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include "sectrust/identity/public_id.hpp"
#include "sectrust/location/dst_location.hpp"
#include "sectrust/location/prefix.hpp"
#include "sectrust/messages/variant.hpp"
#include "sectrust/messages/verify_status.hpp"
#include "sectrust/section/proof_chain.hpp"
#include "sectrust/section/section_key.hpp"
#include "sectrust/section/trusted_keys.hpp"
#include <optional>
#include <span>
#include <string>
#include <variant>

namespace sectrust::routing {

/// A single node vouching for its own message.
struct NodeAuthority {
    PublicId public_id;
    crypto::Ed25519Signature signature{};
    bool operator==(const NodeAuthority&) const = default;
};

/// A section vouching for a message with its collective key.
struct SectionAuthority {
    Prefix prefix;
    SectionSignature signature;
    ProofChain proof;
    bool operator==(const SectionAuthority&) const = default;
};

/**
 * @brief Proof of who sent a message and why to believe them.
 *
 * Both cases sign the same content (destination, destination key and
 * body) and never the authority itself.
 */
class SrcAuthority {
public:
    using Kind = std::variant<NodeAuthority, SectionAuthority>;

    explicit SrcAuthority(NodeAuthority node) : kind_(std::move(node)) {}
    explicit SrcAuthority(SectionAuthority section) : kind_(std::move(section)) {}

    [[nodiscard]] const Kind& GetKind() const noexcept { return kind_; }
    [[nodiscard]] bool IsSection() const noexcept { return std::holds_alternative<SectionAuthority>(kind_); }

    /// Node name or section prefix, for logs.
    [[nodiscard]] std::string SrcLocation() const;

    /**
     * @brief Check the signature alone against `signed_bytes`.
     *
     * Node: the embedded key. Section: the proof chain's last key, which
     * must also be the key the signature names. No trust decision is made.
     */
    [[nodiscard]] Result<Unit, RoutingFailure> CheckSignature(std::span<const uint8_t> signed_bytes) const;

    /**
     * @brief Decide whether the message is trusted.
     *
     * Node authorities are always Full when the signature holds. Section
     * authorities are Full when the proof chain reaches a key in `trusted`
     * for the source prefix or an ancestor, Unknown when the chain is sound
     * but unanchored. A bad signature or broken link is FailedSignature.
     */
    [[nodiscard]] Result<VerifyStatus, RoutingFailure> Verify(
        const DstLocation& dst,
        const std::optional<SectionPublicKey>& dst_key,
        const Variant& variant,
        std::span<const TrustedKey> trusted) const;

    bool operator==(const SrcAuthority&) const = default;

private:
    Kind kind_;
};

}
