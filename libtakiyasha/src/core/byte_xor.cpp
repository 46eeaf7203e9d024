#include "../../include/byte_xor.hpp"
#include <string>

namespace takiyasha {

LengthMismatchError::LengthMismatchError(const std::size_t left, const std::size_t right)
    : std::invalid_argument("Only byte strings of equal length can be xored (" +
                            std::to_string(left) + " != " + std::to_string(right) + ")"),
      left_(left), right_(right) {}

std::vector<std::uint8_t> xor_bytes(const std::span<const std::uint8_t> a, const std::span<const std::uint8_t> b) {
    if (a.size() != b.size()) {
        throw LengthMismatchError(a.size(), b.size());
    }
    std::vector<std::uint8_t> out(a.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        out[i] = static_cast<std::uint8_t>(a[i] ^ b[i]);
    }
    return out;
}

} // namespace takiyasha
