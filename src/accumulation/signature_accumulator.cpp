#include "sectrust/accumulation/signature_accumulator.hpp"
#include "sectrust/crypto/sha3.hpp"
#include "sectrust/core/logging.hpp"
#include <algorithm>
#include <iterator>
#include <fmt/core.h>

namespace sectrust::routing {

    AccumulationOutcome AccumulationOutcome::Pending(const size_t collected, const size_t threshold) {
        AccumulationOutcome outcome;
        outcome.state = AccumulationState::Pending;
        outcome.collected = collected;
        outcome.threshold = threshold;
        return outcome;
    }

    AccumulationOutcome AccumulationOutcome::Finalized(Message message) {
        AccumulationOutcome outcome;
        outcome.state = AccumulationState::Finalized;
        outcome.message = std::move(message);
        return outcome;
    }

    AccumulationOutcome AccumulationOutcome::Ignored() {
        AccumulationOutcome outcome;
        outcome.state = AccumulationState::Ignored;
        return outcome;
    }

    SignatureAccumulator::SignatureAccumulator(std::shared_ptr<const interfaces::IMembershipProvider> membership)
        : membership_(std::move(membership)) {
    }

    Result<KeyDigest, RoutingFailure> SignatureAccumulator::KeyFor(const std::span<const uint8_t> signing_bytes) {
        return crypto::Sha3::Digest256(signing_bytes);
    }

    Result<KeyDigest, RoutingFailure> SignatureAccumulator::KeyFor(const PlainMessage& content) {
        auto bytes = content.SigningBytes();
        if (bytes.IsErr()) {
            return Result<KeyDigest, RoutingFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return KeyFor(bytes.Unwrap());
    }

    Result<AccumulationOutcome, RoutingFailure> SignatureAccumulator::AddShare(const AccumulatingMessage& share) {
        const auto& content = share.Content();
        const auto& signer = share.Share().signer;

        auto bytes = content.SigningBytes();
        if (bytes.IsErr()) {
            return Result<AccumulationOutcome, RoutingFailure>::Err(std::move(bytes).UnwrapErr());
        }
        auto key = KeyFor(bytes.Unwrap());
        if (key.IsErr()) {
            return Result<AccumulationOutcome, RoutingFailure>::Err(std::move(key).UnwrapErr());
        }

        {
            std::shared_lock guard(table_lock_);
            if (finalized_.contains(key.Unwrap())) {
                SECTRUST_LOG_TRACE("Late share from {} for finalized {}", signer.ToString(), content.variant.Name());
                return Result<AccumulationOutcome, RoutingFailure>::Ok(AccumulationOutcome::Ignored());
            }
        }

        const auto section = membership_->CurrentSection();
        if (!(content.src == section.prefix)) {
            return Result<AccumulationOutcome, RoutingFailure>::Err(
                RoutingFailure::ShareRejected(fmt::format(
                    "Content is from section ({}), ours is ({})",
                    content.src.ToString(), section.prefix.ToString())));
        }
        if (!section.Key().Contains(signer)) {
            SECTRUST_LOG_WARN("Share from non-elder {} rejected", signer.ToString());
            return Result<AccumulationOutcome, RoutingFailure>::Err(
                RoutingFailure::ShareRejected("Signer " + signer.ToString() + " is not a current elder"));
        }
        if (!VerifyShare(share.Share(), bytes.Unwrap())) {
            SECTRUST_LOG_WARN("Invalid share signature from elder {}", signer.ToString());
            return Result<AccumulationOutcome, RoutingFailure>::Err(
                RoutingFailure::ShareRejected("Share from " + signer.ToString() + " does not verify"));
        }

        const auto entry = GetOrCreate(key.Unwrap(), content);
        if (!entry) {
            return Result<AccumulationOutcome, RoutingFailure>::Ok(AccumulationOutcome::Ignored());
        }

        std::lock_guard guard(entry->lock);
        if (entry->finalized) {
            return Result<AccumulationOutcome, RoutingFailure>::Ok(AccumulationOutcome::Ignored());
        }
        const bool duplicate = std::any_of(
            entry->shares.begin(), entry->shares.end(),
            [&](const SignatureShare& held) { return held.signer == signer; });
        if (duplicate) {
            return Result<AccumulationOutcome, RoutingFailure>::Ok(AccumulationOutcome::Ignored());
        }
        entry->shares.push_back(share.Share());
        return FinalizeLocked(key.Unwrap(), *entry);
    }

    Result<AccumulationOutcome, RoutingFailure> SignatureAccumulator::TryFinalize(const PlainMessage& content) {
        auto key = KeyFor(content);
        if (key.IsErr()) {
            return Result<AccumulationOutcome, RoutingFailure>::Err(std::move(key).UnwrapErr());
        }

        std::shared_ptr<Entry> entry;
        {
            std::shared_lock guard(table_lock_);
            if (finalized_.contains(key.Unwrap())) {
                return Result<AccumulationOutcome, RoutingFailure>::Err(
                    RoutingFailure::AlreadyFinalized("Message " + std::string(content.variant.Name()) +
                                                     " was already finalized"));
            }
            if (const auto it = entries_.find(key.Unwrap()); it != entries_.end()) {
                entry = it->second;
            }
        }
        if (!entry) {
            return Result<AccumulationOutcome, RoutingFailure>::Ok(
                AccumulationOutcome::Pending(0, membership_->CurrentSection().Key().Threshold()));
        }

        std::lock_guard guard(entry->lock);
        if (entry->finalized) {
            return Result<AccumulationOutcome, RoutingFailure>::Err(
                RoutingFailure::AlreadyFinalized("Message " + std::string(content.variant.Name()) +
                                                 " was already finalized"));
        }
        return FinalizeLocked(key.Unwrap(), *entry);
    }

    std::shared_ptr<SignatureAccumulator::Entry> SignatureAccumulator::GetOrCreate(
        const KeyDigest& key,
        const PlainMessage& content) {
        std::unique_lock guard(table_lock_);
        if (finalized_.contains(key)) {
            return nullptr;
        }
        auto [it, inserted] = entries_.try_emplace(key);
        if (inserted) {
            it->second = std::make_shared<Entry>(content);
            SECTRUST_LOG_DEBUG("Started accumulating {} for {}", content.variant.Name(), content.dst.ToString());
        }
        return it->second;
    }

    Result<AccumulationOutcome, RoutingFailure> SignatureAccumulator::FinalizeLocked(
        const KeyDigest& key,
        Entry& entry) {
        const auto section = membership_->CurrentSection();
        const auto& key = section.Key();

        std::vector<SignatureShare> current;
        current.reserve(entry.shares.size());
        std::copy_if(entry.shares.begin(), entry.shares.end(), std::back_inserter(current),
                     [&](const SignatureShare& share) { return key.Contains(share.signer); });
        if (current.size() < key.Threshold()) {
            return Result<AccumulationOutcome, RoutingFailure>::Ok(
                AccumulationOutcome::Pending(current.size(), key.Threshold()));
        }
        if (!(entry.content.src == section.prefix)) {
            return Result<AccumulationOutcome, RoutingFailure>::Err(
                RoutingFailure::InvalidState(fmt::format(
                    "Section prefix changed from ({}) to ({}) while accumulating",
                    entry.content.src.ToString(), section.prefix.ToString())));
        }

        auto signature = SectionSignature::Combine(key, current);
        if (signature.IsErr()) {
            return Result<AccumulationOutcome, RoutingFailure>::Err(std::move(signature).UnwrapErr());
        }
        SrcAuthority authority(SectionAuthority{
            section.prefix,
            std::move(signature).Unwrap(),
            section.chain.MinimalFrom(entry.content.dst_key)});

        auto message = Message::NewSigned(
            std::move(authority), entry.content.dst, entry.content.dst_key, entry.content.variant);
        if (message.IsErr()) {
            SECTRUST_LOG_ERROR("Combined section signature rejected: {}", message.UnwrapErr().message);
            return Result<AccumulationOutcome, RoutingFailure>::Err(std::move(message).UnwrapErr());
        }

        entry.finalized = true;
        if (!Commit(key, entry)) {
            SECTRUST_LOG_DEBUG("Entry for {} was discarded or already finalized; dropping combined message",
                               entry.content.variant.Name());
            return Result<AccumulationOutcome, RoutingFailure>::Ok(AccumulationOutcome::Ignored());
        }
        SECTRUST_LOG_DEBUG("Finalized {} with {} of {} shares",
                           message.Unwrap().Summary(), current.size(), entry.shares.size());
        return Result<AccumulationOutcome, RoutingFailure>::Ok(
            AccumulationOutcome::Finalized(std::move(message).Unwrap()));
    }

    bool SignatureAccumulator::Commit(const KeyDigest& key, const Entry& entry) {
        std::unique_lock guard(table_lock_);
        const auto it = entries_.find(key);
        if (it == entries_.end() || it->second.get() != &entry) {
            return false;
        }
        if (!finalized_.insert(key).second) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    bool SignatureAccumulator::Discard(const PlainMessage& content) {
        auto key = KeyFor(content);
        if (key.IsErr()) {
            return false;
        }
        std::unique_lock guard(table_lock_);
        return entries_.erase(key.Unwrap()) > 0;
    }

    bool SignatureAccumulator::Forget(const PlainMessage& content) {
        auto key = KeyFor(content);
        if (key.IsErr()) {
            return false;
        }
        std::unique_lock guard(table_lock_);
        return finalized_.erase(key.Unwrap()) > 0;
    }

    size_t SignatureAccumulator::PendingCount() const {
        std::shared_lock guard(table_lock_);
        return entries_.size();
    }

    bool SignatureAccumulator::IsFinalized(const PlainMessage& content) const {
        auto key = KeyFor(content);
        if (key.IsErr()) {
            return false;
        }
        std::shared_lock guard(table_lock_);
        return finalized_.contains(key.Unwrap());
    }

}
