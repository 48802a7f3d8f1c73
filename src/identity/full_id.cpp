#include "sectrust/identity/full_id.hpp"
#include "sectrust/crypto/sodium_interop.hpp"
#include "sectrust/core/logging.hpp"

namespace sectrust::routing {
    using crypto::SodiumInterop;

    PublicId::PublicId(const crypto::Ed25519PublicKey& public_key) noexcept
        : public_key_(public_key)
          , name_(public_key) {
    }

    bool PublicId::Verify(
        const std::span<const uint8_t> bytes,
        const crypto::Ed25519Signature& signature) const {
        return SodiumInterop::VerifyDetached(public_key_, bytes, signature);
    }

    std::string PublicId::ToString() const {
        return "PublicId(" + log::ShortHex(public_key_) + ")";
    }

    FullId::FullId(crypto::SecureMemoryHandle secret_key, PublicId public_id)
        : secret_key_(std::move(secret_key))
          , public_id_(public_id) {
    }

    Result<FullId, RoutingFailure> FullId::Generate() {
        return FromSeed({});
    }

    Result<FullId, RoutingFailure> FullId::FromSeed(const std::span<const uint8_t> seed) {
        auto key_pair = SodiumInterop::GenerateEd25519KeyPair(seed);
        if (key_pair.IsErr()) {
            return Result<FullId, RoutingFailure>::Err(std::move(key_pair).UnwrapErr());
        }
        auto [secret_key, public_key] = std::move(key_pair).Unwrap();
        SECTRUST_LOG_TRACE("Created node identity {}", log::ShortHex(public_key));
        return Result<FullId, RoutingFailure>::Ok(
            FullId(std::move(secret_key), PublicId(public_key)));
    }

    Result<crypto::Ed25519Signature, RoutingFailure> FullId::Sign(
        const std::span<const uint8_t> bytes) const {
        return SodiumInterop::SignDetached(secret_key_, bytes);
    }
}
