#include "sectrust/messages/verify_status.hpp"

namespace sectrust::routing {

Result<Unit, RoutingFailure> RequireFull(const VerifyStatus status) {
    if (status == VerifyStatus::Full) {
        return Result<Unit, RoutingFailure>::Ok(unit);
    }
    return Result<Unit, RoutingFailure>::Err(
        RoutingFailure::UntrustedMessage("Proof chain does not reach a trusted key"));
}

std::string_view ToString(const VerifyStatus status) noexcept {
    switch (status) {
        case VerifyStatus::Full: return "Full";
        case VerifyStatus::Unknown: return "Unknown";
    }
    return "Invalid";
}

}
