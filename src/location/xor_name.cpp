#include "sectrust/location/xor_name.hpp"
#include "sectrust/core/logging.hpp"
#include "sectrust/crypto/sodium_interop.hpp"
#include <algorithm>
#include <cstring>

namespace sectrust::routing {

XorName XorName::FromSpan(const std::span<const uint8_t, Constants::XOR_NAME_SIZE> bytes) noexcept {
    Bytes copy{};
    std::copy(bytes.begin(), bytes.end(), copy.begin());
    return XorName(copy);
}

XorName XorName::Random() {
    Bytes bytes{};
    randombytes_buf(bytes.data(), bytes.size());
    return XorName(bytes);
}

bool XorName::Bit(const size_t index) const noexcept {
    if (index >= Constants::XOR_NAME_BITS) {
        return false;
    }
    const uint8_t byte = bytes_[index / 8];
    return ((byte >> (7 - index % 8)) & 0x01) != 0;
}

XorName XorName::WithBit(const size_t index, const bool value) const noexcept {
    if (index >= Constants::XOR_NAME_BITS) {
        return *this;
    }
    Bytes copy = bytes_;
    const auto mask = static_cast<uint8_t>(0x80 >> (index % 8));
    if (value) {
        copy[index / 8] |= mask;
    } else {
        copy[index / 8] &= static_cast<uint8_t>(~mask);
    }
    return XorName(copy);
}

XorName::Bytes XorName::DistanceTo(const XorName& other) const noexcept {
    Bytes distance{};
    for (size_t i = 0; i < distance.size(); ++i) {
        distance[i] = static_cast<uint8_t>(bytes_[i] ^ other.bytes_[i]);
    }
    return distance;
}

bool XorName::CloserTo(const XorName& target, const XorName& other) const noexcept {
    return DistanceTo(target) < other.DistanceTo(target);
}

std::string XorName::ToHex() const {
    return log::ToHex(bytes_);
}

}

size_t std::hash<sectrust::routing::XorName>::operator()(
    const sectrust::routing::XorName& name) const noexcept {
    size_t value = 0;
    std::memcpy(&value, name.GetBytes().data(), sizeof(value));
    return value;
}
