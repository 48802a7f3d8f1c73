#pragma once
#include "sectrust/location/prefix.hpp"
#include "sectrust/section/section_key.hpp"
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace sectrust::routing {

/// A section key the local node trusts, with the prefix it was trusted for.
struct TrustedKey {
    Prefix prefix;
    SectionPublicKey key;
};

using TrustedKeySnapshot = std::shared_ptr<const std::vector<TrustedKey>>;

/**
 * @brief The local node's table of trusted section keys.
 *
 * Writers replace the whole table; readers take an immutable snapshot and
 * verify against it without further locking.
 */
class TrustedKeyTable {
public:
    TrustedKeyTable();

    /// Trust `key` for `prefix`, replacing any key held for exactly that prefix.
    void Update(const Prefix& prefix, const SectionPublicKey& key);

    /// Drop every entry whose prefix is `prefix` or an extension of it.
    void Prune(const Prefix& prefix);

    [[nodiscard]] TrustedKeySnapshot Snapshot() const;

    [[nodiscard]] size_t Size() const;

private:
    mutable std::shared_mutex lock_;
    TrustedKeySnapshot entries_;
};

[[nodiscard]] std::string FormatTrustedKeys(std::span<const TrustedKey> trusted);

}
