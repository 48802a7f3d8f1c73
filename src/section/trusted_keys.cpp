#include "sectrust/section/trusted_keys.hpp"
#include <algorithm>
#include <mutex>

namespace sectrust::routing {

    TrustedKeyTable::TrustedKeyTable()
        : entries_(std::make_shared<const std::vector<TrustedKey>>()) {
    }

    void TrustedKeyTable::Update(const Prefix& prefix, const SectionPublicKey& key) {
        std::unique_lock guard(lock_);
        auto next = std::make_shared<std::vector<TrustedKey>>(*entries_);
        const auto it = std::find_if(next->begin(), next->end(),
                                     [&](const TrustedKey& entry) { return entry.prefix == prefix; });
        if (it != next->end()) {
            it->key = key;
        } else {
            next->push_back(TrustedKey{prefix, key});
        }
        entries_ = std::move(next);
    }

    void TrustedKeyTable::Prune(const Prefix& prefix) {
        std::unique_lock guard(lock_);
        auto next = std::make_shared<std::vector<TrustedKey>>(*entries_);
        std::erase_if(*next, [&](const TrustedKey& entry) { return entry.prefix.IsExtensionOf(prefix); });
        entries_ = std::move(next);
    }

    TrustedKeySnapshot TrustedKeyTable::Snapshot() const {
        std::shared_lock guard(lock_);
        return entries_;
    }

    size_t TrustedKeyTable::Size() const {
        std::shared_lock guard(lock_);
        return entries_->size();
    }

    std::string FormatTrustedKeys(const std::span<const TrustedKey> trusted) {
        std::string out;
        for (const auto& entry : trusted) {
            if (!out.empty()) {
                out += ", ";
            }
            out += "(" + entry.prefix.ToString() + " -> " + entry.key.ToString() + ")";
        }
        return out;
    }

}
