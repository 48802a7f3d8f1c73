#pragma once
#include "sectrust/location/prefix.hpp"
#include "sectrust/section/proof_chain.hpp"
#include "sectrust/section/section_key.hpp"

namespace sectrust::routing {

/// What the local node currently knows about its own section.
struct SectionInfo {
    Prefix prefix;
    /// Key history; the last key is the section's current collective key.
    ProofChain chain;

    [[nodiscard]] const SectionPublicKey& Key() const noexcept { return chain.LastKey(); }
};

}

namespace sectrust::interfaces {

/// Elder membership as decided by the section's coordination layer.
class IMembershipProvider {
public:
    virtual ~IMembershipProvider() = default;

    /// Consistent snapshot; may change between calls.
    [[nodiscard]] virtual routing::SectionInfo CurrentSection() const = 0;
};

}
