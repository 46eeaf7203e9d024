#ifndef TAKIYASHA_BYTE_XOR_HPP
#define TAKIYASHA_BYTE_XOR_HPP

#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace takiyasha {

/**
 * @brief Raised when two XOR operands differ in length.
 */
class LengthMismatchError : public std::invalid_argument {
public:
    LengthMismatchError(std::size_t left, std::size_t right);

    [[nodiscard]] std::size_t left_size() const noexcept { return left_; }
    [[nodiscard]] std::size_t right_size() const noexcept { return right_; }

private:
    std::size_t left_;
    std::size_t right_;
};

/**
 * @brief Byte-wise XOR of two equally long buffers.
 * @return result[i] = a[i] ^ b[i]
 * @throws LengthMismatchError if a.size() != b.size().
 */
std::vector<std::uint8_t> xor_bytes(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b);

} // namespace takiyasha

#endif // TAKIYASHA_BYTE_XOR_HPP
