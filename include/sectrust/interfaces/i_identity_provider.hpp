#pragma once
#include "sectrust/core/result.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/crypto/sodium_interop.hpp"
#include <span>

namespace sectrust::routing {
class PublicId;
}

namespace sectrust::interfaces {

/// Long-term signing identity of the local node.
class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;
    [[nodiscard]] virtual const routing::PublicId& GetPublicId() const noexcept = 0;
    [[nodiscard]] virtual Result<crypto::Ed25519Signature, RoutingFailure> Sign(
        std::span<const uint8_t> bytes) const = 0;
};

}
