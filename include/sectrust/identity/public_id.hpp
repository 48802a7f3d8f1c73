#pragma once
#include "sectrust/crypto/sodium_interop.hpp"
#include "sectrust/location/xor_name.hpp"
#include <span>
#include <string>

namespace sectrust::routing {

/// Public half of a node identity. The node's name is its Ed25519 key.
class PublicId {
public:
    PublicId() = default;
    explicit PublicId(const crypto::Ed25519PublicKey& public_key) noexcept;

    [[nodiscard]] const crypto::Ed25519PublicKey& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const XorName& Name() const noexcept { return name_; }

    [[nodiscard]] bool Verify(
        std::span<const uint8_t> bytes,
        const crypto::Ed25519Signature& signature) const;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const PublicId& other) const noexcept { return public_key_ == other.public_key_; }
    auto operator<=>(const PublicId& other) const noexcept { return public_key_ <=> other.public_key_; }

private:
    crypto::Ed25519PublicKey public_key_{};
    XorName name_{};
};

}
