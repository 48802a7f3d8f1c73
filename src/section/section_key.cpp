#include "sectrust/section/section_key.hpp"
#include "sectrust/core/constants.hpp"
#include "sectrust/core/logging.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace sectrust::routing {

    namespace {
        void AppendU32(std::vector<uint8_t>& out, const uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }
    }

    SectionPublicKey::SectionPublicKey(
        std::vector<PublicId> elders,
        const size_t threshold,
        const KeyDigest& digest)
        : elders_(std::move(elders))
          , threshold_(threshold)
          , digest_(digest) {
    }

    Result<SectionPublicKey, RoutingFailure> SectionPublicKey::Create(
        std::vector<PublicId> elders,
        const size_t threshold) {
        if (elders.empty() || elders.size() > RoutingConstants::MAX_ELDER_SIZE) {
            return Result<SectionPublicKey, RoutingFailure>::Err(
                RoutingFailure::InvalidInput(fmt::format(
                    "Section key needs 1..{} elders, got {}",
                    RoutingConstants::MAX_ELDER_SIZE, elders.size())));
        }
        if (threshold == 0 || threshold > elders.size()) {
            return Result<SectionPublicKey, RoutingFailure>::Err(
                RoutingFailure::InvalidInput(fmt::format(
                    "Threshold {} out of range for {} elders", threshold, elders.size())));
        }
        std::sort(elders.begin(), elders.end());
        if (std::adjacent_find(elders.begin(), elders.end()) != elders.end()) {
            return Result<SectionPublicKey, RoutingFailure>::Err(
                RoutingFailure::InvalidInput("Section key lists the same elder twice"));
        }

        SectionPublicKey key(std::move(elders), threshold, KeyDigest{});
        auto digest = crypto::Sha3::Digest256(key.ToBytes());
        if (digest.IsErr()) {
            return Result<SectionPublicKey, RoutingFailure>::Err(std::move(digest).UnwrapErr());
        }
        key.digest_ = digest.Unwrap();
        return Result<SectionPublicKey, RoutingFailure>::Ok(std::move(key));
    }

    std::optional<size_t> SectionPublicKey::IndexOf(const PublicId& elder) const noexcept {
        const auto it = std::lower_bound(elders_.begin(), elders_.end(), elder);
        if (it == elders_.end() || !(*it == elder)) {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(elders_.begin(), it));
    }

    std::vector<uint8_t> SectionPublicKey::ToBytes() const {
        std::vector<uint8_t> bytes;
        bytes.reserve(RoutingConstants::SECTION_KEY_DOMAIN.size() + 8 +
                      elders_.size() * Constants::ED_25519_PUBLIC_KEY_SIZE);
        bytes.insert(bytes.end(),
                     RoutingConstants::SECTION_KEY_DOMAIN.begin(),
                     RoutingConstants::SECTION_KEY_DOMAIN.end());
        AppendU32(bytes, static_cast<uint32_t>(threshold_));
        AppendU32(bytes, static_cast<uint32_t>(elders_.size()));
        for (const auto& elder : elders_) {
            const auto& pk = elder.GetPublicKey();
            bytes.insert(bytes.end(), pk.begin(), pk.end());
        }
        return bytes;
    }

    bool SectionPublicKey::Verify(
        const std::span<const uint8_t> bytes,
        const SectionSignature& signature) const {
        if (!crypto::SodiumInterop::ConstantTimeEquals(signature.ClaimedKey(), digest_)) {
            return false;
        }
        const auto& shares = signature.Shares();
        if (shares.size() < threshold_) {
            return false;
        }
        const auto tagged = ShareSigningBytes(bytes);
        std::optional<uint32_t> previous;
        for (const auto& share : shares) {
            if (share.index >= elders_.size()) {
                return false;
            }
            if (previous.has_value() && share.index <= *previous) {
                return false;
            }
            previous = share.index;
            if (!elders_[share.index].Verify(tagged, share.signature)) {
                return false;
            }
        }
        return true;
    }

    std::string SectionPublicKey::ToString() const {
        return fmt::format("SectionKey({}, {}/{})",
                           log::ShortHex(digest_), threshold_, elders_.size());
    }

    Result<SectionSignature, RoutingFailure> SectionSignature::Combine(
        const SectionPublicKey& key,
        const std::span<const SignatureShare> shares) {
        std::vector<IndexedShare> indexed;
        indexed.reserve(shares.size());
        for (const auto& share : shares) {
            if (const auto index = key.IndexOf(share.signer); index.has_value()) {
                indexed.push_back(IndexedShare{
                    .index = static_cast<uint32_t>(*index),
                    .signature = share.signature
                });
            }
        }
        std::sort(indexed.begin(), indexed.end(),
                  [](const IndexedShare& a, const IndexedShare& b) { return a.index < b.index; });
        indexed.erase(
            std::unique(indexed.begin(), indexed.end(),
                        [](const IndexedShare& a, const IndexedShare& b) { return a.index == b.index; }),
            indexed.end());

        if (indexed.size() < key.Threshold()) {
            return Result<SectionSignature, RoutingFailure>::Err(
                RoutingFailure::QuorumNotReached(fmt::format(
                    "{} usable shares, {} needed under {}",
                    indexed.size(), key.Threshold(), key.ToString())));
        }
        indexed.resize(key.Threshold());
        return Result<SectionSignature, RoutingFailure>::Ok(
            SectionSignature(key.Digest(), std::move(indexed)));
    }

    std::vector<uint8_t> ShareSigningBytes(const std::span<const uint8_t> bytes) {
        std::vector<uint8_t> tagged;
        tagged.reserve(RoutingConstants::SECTION_SHARE_DOMAIN.size() + bytes.size());
        tagged.insert(tagged.end(),
                      RoutingConstants::SECTION_SHARE_DOMAIN.begin(),
                      RoutingConstants::SECTION_SHARE_DOMAIN.end());
        tagged.insert(tagged.end(), bytes.begin(), bytes.end());
        return tagged;
    }

    Result<SignatureShare, RoutingFailure> SignShare(
        const interfaces::IIdentityProvider& elder,
        const std::span<const uint8_t> bytes) {
        auto signature = elder.Sign(ShareSigningBytes(bytes));
        if (signature.IsErr()) {
            return Result<SignatureShare, RoutingFailure>::Err(std::move(signature).UnwrapErr());
        }
        return Result<SignatureShare, RoutingFailure>::Ok(
            SignatureShare{elder.GetPublicId(), signature.Unwrap()});
    }

    bool VerifyShare(const SignatureShare& share, const std::span<const uint8_t> bytes) {
        return share.signer.Verify(ShareSigningBytes(bytes), share.signature);
    }

    Result<SectionSignature, RoutingFailure> SignAsSection(
        const SectionPublicKey& key,
        const std::span<const interfaces::IIdentityProvider* const> signers,
        const std::span<const uint8_t> bytes) {
        std::vector<SignatureShare> shares;
        shares.reserve(signers.size());
        for (const auto* signer : signers) {
            if (signer == nullptr) {
                return Result<SectionSignature, RoutingFailure>::Err(
                    RoutingFailure::InvalidInput("Null signer"));
            }
            auto share = SignShare(*signer, bytes);
            if (share.IsErr()) {
                return Result<SectionSignature, RoutingFailure>::Err(std::move(share).UnwrapErr());
            }
            shares.push_back(std::move(share).Unwrap());
        }
        return SectionSignature::Combine(key, shares);
    }

}
