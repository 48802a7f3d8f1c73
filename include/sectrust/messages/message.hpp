#pragma once
#include "sectrust/configuration/routing_config.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include "sectrust/interfaces/i_identity_provider.hpp"
#include "sectrust/location/dst_location.hpp"
#include "sectrust/messages/message_hash.hpp"
#include "sectrust/messages/src_authority.hpp"
#include "sectrust/messages/variant.hpp"
#include "sectrust/messages/verify_status.hpp"
#include "sectrust/section/section_key.hpp"
#include "sectrust/section/trusted_keys.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sectrust::routing {

struct QueuedMessage;

/**
 * @brief A signed message as sent over the network.
 *
 * Only exists finalized: every constructor signs or checks the signature,
 * then caches the wire bytes and their hash. Read-only afterwards.
 */
class Message {
public:
    /// Sign as a single node.
    [[nodiscard]] static Result<Message, RoutingFailure> SingleSrc(
        const interfaces::IIdentityProvider& src,
        DstLocation dst,
        std::optional<SectionPublicKey> dst_key,
        Variant variant);

    /// Wrap an authority that already signed the content. Its signature is checked.
    [[nodiscard]] static Result<Message, RoutingFailure> NewSigned(
        SrcAuthority src,
        DstLocation dst,
        std::optional<SectionPublicKey> dst_key,
        Variant variant);

    /**
     * @brief Decode received bytes.
     *
     * The signature is checked before the message is accepted; the bytes
     * are kept verbatim and hashed as received. Non-canonical encodings,
     * oversize input and over-long proof chains are rejected.
     */
    [[nodiscard]] static Result<Message, RoutingFailure> FromBytes(
        std::span<const uint8_t> bytes,
        const configuration::RoutingConfig& config = configuration::RoutingConfig::Default());

    /// Bytes to send; exactly what was signed or received.
    [[nodiscard]] const std::vector<uint8_t>& ToBytes() const noexcept { return *serialized_; }

    /// Trust decision against a snapshot of trusted keys. Failures are logged.
    [[nodiscard]] Result<VerifyStatus, RoutingFailure> Verify(std::span<const TrustedKey> trusted) const;

    [[nodiscard]] QueuedMessage IntoQueued(std::optional<PeerAddress> sender) &&;

    [[nodiscard]] const DstLocation& Dst() const noexcept { return dst_; }
    [[nodiscard]] const SrcAuthority& Src() const noexcept { return src_; }
    [[nodiscard]] const Variant& GetVariant() const noexcept { return variant_; }
    [[nodiscard]] const std::optional<SectionPublicKey>& DstKey() const noexcept { return dst_key_; }
    [[nodiscard]] const MessageHash& Hash() const noexcept { return hash_; }

    /// Source, destination and body kind; no key material.
    [[nodiscard]] std::string Summary() const;

    bool operator==(const Message& other) const;

private:
    Message(DstLocation dst, SrcAuthority src, Variant variant, std::optional<SectionPublicKey> dst_key);

    Result<Unit, RoutingFailure> Finalize(std::vector<uint8_t> wire_bytes);

    DstLocation dst_;
    SrcAuthority src_;
    Variant variant_;
    std::optional<SectionPublicKey> dst_key_;
    std::shared_ptr<const std::vector<uint8_t>> serialized_;
    MessageHash hash_;
};

/// A received message with the transport address it came from.
struct QueuedMessage {
    Message message;
    std::optional<PeerAddress> sender;
};

/// Error record for a failed verification: message, failure and every trusted key.
void LogVerifyFailure(
    const std::string& message_summary,
    const RoutingFailure& failure,
    std::span<const TrustedKey> trusted);

}
