#pragma once
#include "sectrust/core/result.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/location/prefix.hpp"
#include "sectrust/section/section_key.hpp"
#include <optional>
#include <span>
#include <vector>

namespace sectrust::routing {

struct TrustedKey;

/// Outcome of anchoring a proof chain in a set of trusted keys.
enum class TrustStatus {
    /// A trusted key is in the chain and every link from it verifies.
    Trusted,
    /// The chain verifies on its own but none of its keys is trusted.
    Unknown,
    /// Some link is not signed by its predecessor.
    Invalid
};

/// A key transition: `key` signed by the previous key in the chain.
struct ProofBlock {
    SectionPublicKey key;
    SectionSignature signature;
};

/**
 * @brief Ordered history of a section's collective keys.
 *
 * Key 0 is the first key; every later key is carried by a block whose
 * signature was made by the key before it. The last key is the one that
 * signs the section's current messages.
 */
class ProofChain {
public:
    explicit ProofChain(SectionPublicKey first_key);

    /// Rebuild a chain as received. Links are not checked; see SelfVerify.
    [[nodiscard]] static ProofChain FromParts(SectionPublicKey first_key, std::vector<ProofBlock> blocks);

    /// Append a key signed by the current last key. Fails if the link does not verify.
    Result<Unit, RoutingFailure> Push(SectionPublicKey key, SectionSignature signature);

    [[nodiscard]] const SectionPublicKey& FirstKey() const noexcept { return first_key_; }
    [[nodiscard]] const SectionPublicKey& LastKey() const noexcept;
    [[nodiscard]] const SectionPublicKey& KeyAt(size_t index) const;
    [[nodiscard]] const std::vector<ProofBlock>& Blocks() const noexcept { return blocks_; }

    /// Number of keys, the first key included.
    [[nodiscard]] size_t Length() const noexcept { return blocks_.size() + 1; }

    [[nodiscard]] std::optional<size_t> IndexOf(const SectionPublicKey& key) const noexcept;
    [[nodiscard]] bool Has(const SectionPublicKey& key) const noexcept { return IndexOf(key).has_value(); }

    [[nodiscard]] bool SelfVerify() const;

    /**
     * @brief Anchor the chain in `trusted` for a message from `origin`.
     *
     * Only trusted entries whose prefix is `origin` or one of its ancestors
     * are considered; among those found in the chain the longest prefix
     * wins, then the most recent key.
     */
    [[nodiscard]] TrustStatus CheckTrust(
        std::span<const TrustedKey> trusted,
        const Prefix& origin) const;

    /// Key index the chain is anchored at, under the same rules as CheckTrust.
    [[nodiscard]] std::optional<size_t> TrustedAnchor(
        std::span<const TrustedKey> trusted,
        const Prefix& origin) const;

    /// Chain starting at key `index`. Out of range yields just the last key.
    [[nodiscard]] ProofChain SliceFrom(size_t index) const;

    /**
     * @brief Shortest chain a holder of `known_key` can verify.
     *
     * The whole chain when `known_key` is absent or not part of it.
     */
    [[nodiscard]] ProofChain MinimalFrom(const std::optional<SectionPublicKey>& known_key) const;

    bool operator==(const ProofChain& other) const;

private:
    ProofChain(SectionPublicKey first_key, std::vector<ProofBlock> blocks);

    SectionPublicKey first_key_;
    std::vector<ProofBlock> blocks_;
};

}
