#pragma once
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include "sectrust/interfaces/i_membership_provider.hpp"
#include "sectrust/messages/accumulating_message.hpp"
#include "sectrust/messages/message.hpp"
#include "sectrust/messages/plain_message.hpp"
#include "sectrust/section/section_key.hpp"
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sectrust::routing {

enum class AccumulationState {
    /// Collecting; not enough shares from current elders yet.
    Pending,
    /// This call produced the section message.
    Finalized,
    /// Duplicate share, or the message was already finalized.
    Ignored
};

struct AccumulationOutcome {
    AccumulationState state = AccumulationState::Pending;
    /// Shares from currently recognised elders, for Pending.
    size_t collected = 0;
    size_t threshold = 0;
    std::optional<Message> message;

    [[nodiscard]] static AccumulationOutcome Pending(size_t collected, size_t threshold);
    [[nodiscard]] static AccumulationOutcome Finalized(Message message);
    [[nodiscard]] static AccumulationOutcome Ignored();
};

/**
 * @brief Collects elder signature shares until a section message can be signed.
 *
 * One entry per plain message, keyed by the digest of its signing bytes.
 * Each entry has its own lock, so unrelated messages accumulate in
 * parallel; the table lock is only held to find, create or retire entries.
 *
 * A message finalizes at most once. Finalized keys are remembered so late
 * shares are ignored and TryFinalize reports AlreadyFinalized, until
 * Forget() drops them. Pending entries never expire on their own; the
 * owner evicts them with Discard().
 *
 * Membership is read from the provider for every share and again when
 * combining, so shares from elders that have since left are not used.
 */
class SignatureAccumulator {
public:
    explicit SignatureAccumulator(std::shared_ptr<const interfaces::IMembershipProvider> membership);

    SignatureAccumulator(const SignatureAccumulator&) = delete;
    SignatureAccumulator& operator=(const SignatureAccumulator&) = delete;

    /**
     * @brief Record one elder's share and finalize if quorum is reached.
     *
     * Err(ShareRejected) when the signer is not a current elder, the share
     * does not verify, or the content is not from our section.
     */
    [[nodiscard]] Result<AccumulationOutcome, RoutingFailure> AddShare(const AccumulatingMessage& share);

    /// Finalize with the shares held so far. Err(AlreadyFinalized) if done before.
    [[nodiscard]] Result<AccumulationOutcome, RoutingFailure> TryFinalize(const PlainMessage& content);

    /// Drop the pending entry for `content`. Returns whether one existed.
    bool Discard(const PlainMessage& content);

    /// Forget that `content` was finalized. Returns whether it was.
    bool Forget(const PlainMessage& content);

    [[nodiscard]] size_t PendingCount() const;

    [[nodiscard]] bool IsFinalized(const PlainMessage& content) const;

private:
    struct Entry {
        std::mutex lock;
        PlainMessage content;
        std::vector<SignatureShare> shares;
        bool finalized = false;

        explicit Entry(PlainMessage c) : content(std::move(c)) {}
    };

    struct DigestHash {
        size_t operator()(const KeyDigest& digest) const noexcept {
            size_t value = 0;
            std::memcpy(&value, digest.data(), sizeof(value));
            return value;
        }
    };

    [[nodiscard]] static Result<KeyDigest, RoutingFailure> KeyFor(std::span<const uint8_t> signing_bytes);
    [[nodiscard]] static Result<KeyDigest, RoutingFailure> KeyFor(const PlainMessage& content);

    /// Existing or new entry; null if `key` was finalized meanwhile.
    [[nodiscard]] std::shared_ptr<Entry> GetOrCreate(const KeyDigest& key, const PlainMessage& content);

    /**
     * @brief Combine if current elders' shares reach the threshold. Caller holds `entry.lock`.
     *
     * A combined message is reported Finalized only if Commit succeeds;
     * an entry discarded or replaced meanwhile yields Ignored.
     */
    [[nodiscard]] Result<AccumulationOutcome, RoutingFailure> FinalizeLocked(const KeyDigest& key, Entry& entry);

    /// Tombstone `key` and drop its entry, iff `entry` is still the live one and `key` was not finalized.
    [[nodiscard]] bool Commit(const KeyDigest& key, const Entry& entry);

    std::shared_ptr<const interfaces::IMembershipProvider> membership_;
    mutable std::shared_mutex table_lock_;
    std::unordered_map<KeyDigest, std::shared_ptr<Entry>, DigestHash> entries_;
    std::unordered_set<KeyDigest, DigestHash> finalized_;
};

}
