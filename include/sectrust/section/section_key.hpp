#pragma once
#include "sectrust/core/result.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/crypto/sha3.hpp"
#include "sectrust/crypto/sodium_interop.hpp"
#include "sectrust/identity/public_id.hpp"
#include "sectrust/interfaces/i_identity_provider.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sectrust::routing {

using KeyDigest = crypto::Sha3Digest;

/// One elder's signature over the content a section is signing.
struct SignatureShare {
    PublicId signer;
    crypto::Ed25519Signature signature{};

    bool operator==(const SignatureShare&) const = default;
};

class SectionSignature;

/**
 * @brief Collective key of a section.
 *
 * The elders' Ed25519 keys, kept sorted, plus the number of distinct elder
 * signatures a collective signature needs. Two keys are the same key iff
 * their canonical bytes (and so their digests) are equal.
 */
class SectionPublicKey {
public:
    [[nodiscard]] static Result<SectionPublicKey, RoutingFailure> Create(
        std::vector<PublicId> elders,
        size_t threshold);

    [[nodiscard]] size_t Threshold() const noexcept { return threshold_; }
    [[nodiscard]] size_t Size() const noexcept { return elders_.size(); }
    [[nodiscard]] const std::vector<PublicId>& Elders() const noexcept { return elders_; }
    [[nodiscard]] const KeyDigest& Digest() const noexcept { return digest_; }

    [[nodiscard]] std::optional<size_t> IndexOf(const PublicId& elder) const noexcept;
    [[nodiscard]] bool Contains(const PublicId& elder) const noexcept { return IndexOf(elder).has_value(); }

    /// Domain tag, threshold and elder keys; what a proof chain link signs.
    [[nodiscard]] std::vector<uint8_t> ToBytes() const;

    [[nodiscard]] bool Verify(std::span<const uint8_t> bytes, const SectionSignature& signature) const;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const SectionPublicKey& other) const noexcept {
        return threshold_ == other.threshold_ && elders_ == other.elders_;
    }

private:
    SectionPublicKey(std::vector<PublicId> elders, size_t threshold, const KeyDigest& digest);

    std::vector<PublicId> elders_;
    size_t threshold_ = 0;
    KeyDigest digest_{};
};

/**
 * @brief Section signature: `threshold` elder signatures under one key.
 *
 * Shares are ordered by elder index, which makes the combined signature a
 * function of the share set alone.
 */
class SectionSignature {
public:
    struct IndexedShare {
        uint32_t index = 0;
        crypto::Ed25519Signature signature{};
        bool operator==(const IndexedShare&) const = default;
    };

    SectionSignature() = default;
    SectionSignature(const KeyDigest& key_digest, std::vector<IndexedShare> shares)
        : key_digest_(key_digest), shares_(std::move(shares)) {}

    /**
     * @brief Combine shares under `key`.
     *
     * Shares from signers outside the key are dropped, as are repeats of the
     * same signer. The `Threshold()` lowest-indexed remaining shares form the
     * signature. Shares are not re-verified here.
     */
    [[nodiscard]] static Result<SectionSignature, RoutingFailure> Combine(
        const SectionPublicKey& key,
        std::span<const SignatureShare> shares);

    /// Digest of the key this signature claims to be made under.
    [[nodiscard]] const KeyDigest& ClaimedKey() const noexcept { return key_digest_; }
    [[nodiscard]] const std::vector<IndexedShare>& Shares() const noexcept { return shares_; }

    bool operator==(const SectionSignature&) const = default;

private:
    KeyDigest key_digest_{};
    std::vector<IndexedShare> shares_;
};

/**
 * @brief Bytes an elder signs for a section share over `bytes`.
 *
 * The share domain tag is prepended so a share is never a valid node
 * signature over the same content, and the reverse.
 */
[[nodiscard]] std::vector<uint8_t> ShareSigningBytes(std::span<const uint8_t> bytes);

/// `elder`'s section share over `bytes`.
[[nodiscard]] Result<SignatureShare, RoutingFailure> SignShare(
    const interfaces::IIdentityProvider& elder,
    std::span<const uint8_t> bytes);

[[nodiscard]] bool VerifyShare(const SignatureShare& share, std::span<const uint8_t> bytes);

/// Sign `bytes` with every elder in `signers` and combine under `key`.
[[nodiscard]] Result<SectionSignature, RoutingFailure> SignAsSection(
    const SectionPublicKey& key,
    std::span<const interfaces::IIdentityProvider* const> signers,
    std::span<const uint8_t> bytes);

}
