#pragma once
#include "sectrust/location/xor_name.hpp"
#include <compare>
#include <cstdint>
#include <string>

namespace sectrust::routing {

/**
 * @brief Leading bits of the name space a section is responsible for.
 *
 * Bits beyond `bit_count` are always cleared so equal prefixes compare equal.
 */
class Prefix {
public:
    Prefix() noexcept = default;
    Prefix(uint16_t bit_count, const XorName& name) noexcept;

    [[nodiscard]] uint16_t BitCount() const noexcept { return bit_count_; }
    [[nodiscard]] const XorName& Name() const noexcept { return name_; }

    [[nodiscard]] bool Matches(const XorName& name) const noexcept;

    /// True if `other` is this prefix or one of its ancestors.
    [[nodiscard]] bool IsExtensionOf(const Prefix& other) const noexcept;

    [[nodiscard]] bool IsCompatible(const Prefix& other) const noexcept;

    [[nodiscard]] Prefix Pushed(bool bit) const noexcept;
    [[nodiscard]] Prefix Popped() const noexcept;

    /// Binary rendering of the significant bits, e.g. "01"; "" for the root.
    [[nodiscard]] std::string ToString() const;

    bool operator==(const Prefix& other) const noexcept {
        return bit_count_ == other.bit_count_ && name_ == other.name_;
    }
    std::strong_ordering operator<=>(const Prefix& other) const noexcept;

private:
    uint16_t bit_count_ = 0;
    XorName name_{};
};

}
