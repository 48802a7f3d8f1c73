#include "sectrust/section/proof_chain.hpp"
#include "sectrust/section/trusted_keys.hpp"
#include "sectrust/core/logging.hpp"
#include <stdexcept>

namespace sectrust::routing {

    ProofChain::ProofChain(SectionPublicKey first_key)
        : first_key_(std::move(first_key)) {
    }

    ProofChain::ProofChain(SectionPublicKey first_key, std::vector<ProofBlock> blocks)
        : first_key_(std::move(first_key))
          , blocks_(std::move(blocks)) {
    }

    ProofChain ProofChain::FromParts(SectionPublicKey first_key, std::vector<ProofBlock> blocks) {
        return ProofChain(std::move(first_key), std::move(blocks));
    }

    Result<Unit, RoutingFailure> ProofChain::Push(SectionPublicKey key, SectionSignature signature) {
        if (!LastKey().Verify(key.ToBytes(), signature)) {
            return Result<Unit, RoutingFailure>::Err(
                RoutingFailure::InvalidProof(
                    "New key " + key.ToString() + " is not signed by " + LastKey().ToString()));
        }
        blocks_.push_back(ProofBlock{std::move(key), std::move(signature)});
        return Result<Unit, RoutingFailure>::Ok(unit);
    }

    const SectionPublicKey& ProofChain::LastKey() const noexcept {
        if (blocks_.empty()) {
            return first_key_;
        }
        return blocks_.back().key;
    }

    const SectionPublicKey& ProofChain::KeyAt(const size_t index) const {
        if (index == 0) {
            return first_key_;
        }
        if (index > blocks_.size()) {
            throw std::out_of_range("Proof chain key index out of range");
        }
        return blocks_[index - 1].key;
    }

    std::optional<size_t> ProofChain::IndexOf(const SectionPublicKey& key) const noexcept {
        for (size_t i = Length(); i > 0; --i) {
            if (KeyAt(i - 1).Digest() == key.Digest()) {
                return i - 1;
            }
        }
        return std::nullopt;
    }

    bool ProofChain::SelfVerify() const {
        const SectionPublicKey* signer = &first_key_;
        for (const auto& block : blocks_) {
            if (!signer->Verify(block.key.ToBytes(), block.signature)) {
                return false;
            }
            signer = &block.key;
        }
        return true;
    }

    std::optional<size_t> ProofChain::TrustedAnchor(
        const std::span<const TrustedKey> trusted,
        const Prefix& origin) const {
        std::optional<size_t> best_index;
        uint16_t best_bits = 0;
        for (const auto& entry : trusted) {
            if (!origin.IsExtensionOf(entry.prefix)) {
                continue;
            }
            const auto index = IndexOf(entry.key);
            if (!index.has_value()) {
                continue;
            }
            const uint16_t bits = entry.prefix.BitCount();
            if (!best_index.has_value() || bits > best_bits ||
                (bits == best_bits && *index > *best_index)) {
                best_index = index;
                best_bits = bits;
            }
        }
        return best_index;
    }

    TrustStatus ProofChain::CheckTrust(
        const std::span<const TrustedKey> trusted,
        const Prefix& origin) const {
        if (!SelfVerify()) {
            return TrustStatus::Invalid;
        }
        if (TrustedAnchor(trusted, origin).has_value()) {
            return TrustStatus::Trusted;
        }
        return TrustStatus::Unknown;
    }

    ProofChain ProofChain::SliceFrom(const size_t index) const {
        if (index == 0) {
            return *this;
        }
        if (index > blocks_.size()) {
            return ProofChain(LastKey());
        }
        std::vector<ProofBlock> tail(blocks_.begin() + static_cast<std::ptrdiff_t>(index), blocks_.end());
        return ProofChain(blocks_[index - 1].key, std::move(tail));
    }

    ProofChain ProofChain::MinimalFrom(const std::optional<SectionPublicKey>& known_key) const {
        if (!known_key.has_value()) {
            return *this;
        }
        if (const auto index = IndexOf(*known_key); index.has_value()) {
            return SliceFrom(*index);
        }
        return *this;
    }

    bool ProofChain::operator==(const ProofChain& other) const {
        if (!(first_key_ == other.first_key_) || blocks_.size() != other.blocks_.size()) {
            return false;
        }
        for (size_t i = 0; i < blocks_.size(); ++i) {
            if (!(blocks_[i].key == other.blocks_[i].key) ||
                !(blocks_[i].signature == other.blocks_[i].signature)) {
                return false;
            }
        }
        return true;
    }

}
