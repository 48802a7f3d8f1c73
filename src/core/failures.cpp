#include "sectrust/core/failures.hpp"

namespace sectrust {

std::string_view ToString(const RoutingFailureType type) noexcept {
    switch (type) {
        case RoutingFailureType::Serialize: return "Serialize";
        case RoutingFailureType::Deserialize: return "Deserialize";
        case RoutingFailureType::FailedSignature: return "FailedSignature";
        case RoutingFailureType::InvalidProof: return "InvalidProof";
        case RoutingFailureType::UntrustedMessage: return "UntrustedMessage";
        case RoutingFailureType::ShareRejected: return "ShareRejected";
        case RoutingFailureType::AlreadyFinalized: return "AlreadyFinalized";
        case RoutingFailureType::QuorumNotReached: return "QuorumNotReached";
        case RoutingFailureType::InvalidInput: return "InvalidInput";
        case RoutingFailureType::KeyGeneration: return "KeyGeneration";
        case RoutingFailureType::InvalidState: return "InvalidState";
        case RoutingFailureType::CryptoInit: return "CryptoInit";
    }
    return "Unknown";
}

}
