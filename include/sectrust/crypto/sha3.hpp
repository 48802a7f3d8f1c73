#pragma once
#include "sectrust/core/result.hpp"
#include "sectrust/core/failures.hpp"
#include "sectrust/core/constants.hpp"
#include <array>
#include <initializer_list>
#include <cstdint>
#include <span>

namespace sectrust::crypto {

using Sha3Digest = std::array<uint8_t, Constants::SHA3_256_DIGEST_SIZE>;

class Sha3 {
public:
    /// SHA3-256 of the concatenation of all parts.
    [[nodiscard]] static Result<Sha3Digest, RoutingFailure> Digest256(
        std::initializer_list<std::span<const uint8_t>> parts);

    [[nodiscard]] static Result<Sha3Digest, RoutingFailure> Digest256(
        std::span<const uint8_t> data);

private:
    Sha3() = delete;
};

}
