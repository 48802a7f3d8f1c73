#include "sectrust/location/prefix.hpp"
#include <algorithm>

namespace sectrust::routing {

namespace {
    XorName MaskName(const uint16_t bit_count, const XorName& name) noexcept {
        XorName::Bytes bytes = name.GetBytes();
        for (size_t i = 0; i < bytes.size(); ++i) {
            const size_t first_bit = i * 8;
            if (first_bit + 8 <= bit_count) {
                continue;
            }
            if (first_bit >= bit_count) {
                bytes[i] = 0;
            } else {
                const auto keep = static_cast<uint8_t>(0xFF << (8 - (bit_count - first_bit)));
                bytes[i] &= keep;
            }
        }
        return XorName(bytes);
    }
}

Prefix::Prefix(const uint16_t bit_count, const XorName& name) noexcept
    : bit_count_(static_cast<uint16_t>(std::min<size_t>(bit_count, Constants::XOR_NAME_BITS)))
    , name_(MaskName(bit_count_, name)) {
}

bool Prefix::Matches(const XorName& name) const noexcept {
    return MaskName(bit_count_, name) == name_;
}

bool Prefix::IsExtensionOf(const Prefix& other) const noexcept {
    return bit_count_ >= other.bit_count_ && other.Matches(name_);
}

bool Prefix::IsCompatible(const Prefix& other) const noexcept {
    return IsExtensionOf(other) || other.IsExtensionOf(*this);
}

Prefix Prefix::Pushed(const bool bit) const noexcept {
    if (bit_count_ >= Constants::XOR_NAME_BITS) {
        return *this;
    }
    return Prefix(static_cast<uint16_t>(bit_count_ + 1), name_.WithBit(bit_count_, bit));
}

Prefix Prefix::Popped() const noexcept {
    if (bit_count_ == 0) {
        return *this;
    }
    return Prefix(static_cast<uint16_t>(bit_count_ - 1), name_);
}

std::string Prefix::ToString() const {
    std::string bits;
    bits.reserve(bit_count_);
    for (size_t i = 0; i < bit_count_; ++i) {
        bits.push_back(name_.Bit(i) ? '1' : '0');
    }
    return bits;
}

std::strong_ordering Prefix::operator<=>(const Prefix& other) const noexcept {
    if (const auto by_name = name_ <=> other.name_; by_name != std::strong_ordering::equal) {
        return by_name;
    }
    return bit_count_ <=> other.bit_count_;
}

}
