#include "sectrust/configuration/routing_config.hpp"
#include <fmt/core.h>

namespace sectrust::configuration {

Result<Unit, RoutingFailure> RoutingConfig::Validate() const {
    if (elder_size < RoutingConstants::MIN_ELDER_SIZE || elder_size > RoutingConstants::MAX_ELDER_SIZE) {
        return Result<Unit, RoutingFailure>::Err(RoutingFailure::InvalidInput(fmt::format(
            "elder_size {} outside {}..{}",
            elder_size, RoutingConstants::MIN_ELDER_SIZE, RoutingConstants::MAX_ELDER_SIZE)));
    }
    if (max_message_size == 0 || max_message_size > RoutingConstants::MAX_MESSAGE_SIZE_LIMIT) {
        return Result<Unit, RoutingFailure>::Err(RoutingFailure::InvalidInput(fmt::format(
            "max_message_size {} outside 1..{}", max_message_size, RoutingConstants::MAX_MESSAGE_SIZE_LIMIT)));
    }
    if (max_proof_chain_length == 0) {
        return Result<Unit, RoutingFailure>::Err(
            RoutingFailure::InvalidInput("max_proof_chain_length must be positive"));
    }
    return Result<Unit, RoutingFailure>::Ok(unit);
}

void RoutingConfig::ApplyLogging() const noexcept {
    log::SetLevel(log_level);
}

}
