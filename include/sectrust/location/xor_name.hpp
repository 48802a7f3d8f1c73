#pragma once
#include "sectrust/core/constants.hpp"
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <span>
#include <string>

namespace sectrust::routing {

/// 256-bit name in the XOR-distance name space.
class XorName {
public:
    using Bytes = std::array<uint8_t, Constants::XOR_NAME_SIZE>;

    constexpr XorName() noexcept = default;
    explicit constexpr XorName(const Bytes& bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static XorName FromSpan(std::span<const uint8_t, Constants::XOR_NAME_SIZE> bytes) noexcept;
    [[nodiscard]] static XorName Random();

    [[nodiscard]] const Bytes& GetBytes() const noexcept { return bytes_; }

    /// Bit `index` counted from the most significant bit of byte 0.
    [[nodiscard]] bool Bit(size_t index) const noexcept;

    [[nodiscard]] XorName WithBit(size_t index, bool value) const noexcept;

    [[nodiscard]] Bytes DistanceTo(const XorName& other) const noexcept;

    /// True when this name is closer to `target` than `other` is.
    [[nodiscard]] bool CloserTo(const XorName& target, const XorName& other) const noexcept;

    [[nodiscard]] std::string ToHex() const;

    auto operator<=>(const XorName&) const = default;
    bool operator==(const XorName&) const = default;

private:
    Bytes bytes_{};
};

}

template<>
struct std::hash<sectrust::routing::XorName> {
    size_t operator()(const sectrust::routing::XorName& name) const noexcept;
};
