#pragma once

#include "sectrust/core/constants.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/core/logging.hpp"
#include "sectrust/core/result.hpp"

#include <cstddef>

namespace sectrust::configuration {

/// Limits and section parameters for message authentication.
///
/// Values are plain data; the factories give the supported presets and
/// `Validate()` rejects combinations the rest of the library cannot honour.
///
/// @example
/// ```cpp
/// auto config = RoutingConfig::Default();
/// config.elder_size = 5;
/// if (config.Validate().IsOk()) {
///     config.ApplyLogging();
/// }
/// ```
class RoutingConfig {
public:
    /// Elders per section; a section key needs QuorumCount(elder_size) shares.
    size_t elder_size = RoutingConstants::DEFAULT_ELDER_SIZE;

    /// Largest wire message accepted by Message::FromBytes.
    size_t max_message_size = RoutingConstants::DEFAULT_MAX_MESSAGE_SIZE;

    /// Largest number of keys in a decoded proof chain.
    size_t max_proof_chain_length = RoutingConstants::DEFAULT_MAX_PROOF_CHAIN_LENGTH;

    log::Level log_level = log::Level::Info;

    /// Production defaults: seven elders, 10 MiB messages.
    [[nodiscard]] static constexpr RoutingConfig Default() noexcept {
        return RoutingConfig{};
    }

    /// Small sections and verbose logs for tests.
    [[nodiscard]] static constexpr RoutingConfig ForTesting() noexcept {
        RoutingConfig config{};
        config.elder_size = 3;
        config.max_message_size = 1024 * 1024;
        config.max_proof_chain_length = 64;
        config.log_level = log::Level::Debug;
        return config;
    }

    /// Majority of `elder_count`: the number of shares a collective signature needs.
    [[nodiscard]] static constexpr size_t QuorumCount(const size_t elder_count) noexcept {
        return 1 + elder_count / 2;
    }

    [[nodiscard]] constexpr size_t Quorum() const noexcept {
        return QuorumCount(elder_size);
    }

    [[nodiscard]] Result<Unit, RoutingFailure> Validate() const;

    /// Install `log_level` as the process-wide level.
    void ApplyLogging() const noexcept;
};

}
