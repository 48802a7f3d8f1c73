#pragma once
#include "sectrust/interfaces/i_identity_provider.hpp"
#include "sectrust/identity/public_id.hpp"
#include "sectrust/crypto/secure_memory_handle.hpp"
#include "sectrust/core/result.hpp"
#include "sectrust/core/failures.hpp"
#include <span>

namespace sectrust::routing {

/**
 * @brief A node's Ed25519 key pair.
 *
 * The secret key lives in libsodium secure memory and never leaves it;
 * signing reads it in place. Move-only.
 */
class FullId final : public interfaces::IIdentityProvider {
public:
    [[nodiscard]] static Result<FullId, RoutingFailure> Generate();

    /// Deterministic identity from a 32-byte seed.
    [[nodiscard]] static Result<FullId, RoutingFailure> FromSeed(std::span<const uint8_t> seed);

    FullId(FullId&&) noexcept = default;
    FullId& operator=(FullId&&) noexcept = default;
    FullId(const FullId&) = delete;
    FullId& operator=(const FullId&) = delete;
    ~FullId() override = default;

    [[nodiscard]] const PublicId& GetPublicId() const noexcept override { return public_id_; }

    [[nodiscard]] Result<crypto::Ed25519Signature, RoutingFailure> Sign(
        std::span<const uint8_t> bytes) const override;

private:
    FullId(crypto::SecureMemoryHandle secret_key, PublicId public_id);

    crypto::SecureMemoryHandle secret_key_;
    PublicId public_id_;
};

}
