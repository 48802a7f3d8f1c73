#pragma once
#include "sectrust/core/failures.hpp"
#include "sectrust/core/result.hpp"
#include <string_view>

namespace sectrust::routing {

enum class VerifyStatus {
    /// Signed and anchored in a key we trust.
    Full,
    /// Correctly signed, but its proof does not reach any key we trust.
    /// Relay it to nodes that may know more; do not act on it.
    Unknown
};

/// `Unknown` becomes an `UntrustedMessage` failure.
[[nodiscard]] Result<Unit, RoutingFailure> RequireFull(VerifyStatus status);

[[nodiscard]] std::string_view ToString(VerifyStatus status) noexcept;

/// What a dispatcher decided to do with an incoming message.
enum class MessageStatus {
    /// Handle it.
    Useful,
    /// Discard it.
    Useless,
    /// Its trust cannot be established.
    Untrusted,
    /// We are not in a state to handle it (e.g. it needs an elder and we are not one).
    Unknown
};

}
