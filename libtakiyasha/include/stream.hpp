/**
 * @file stream.hpp
 * @brief Abstract byte stream handed from callers to decoders.
 */

#ifndef TAKIYASHA_STREAM_HPP
#define TAKIYASHA_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace takiyasha {

/**
 * @brief Raised by stream operations that fail or that the stream does not have.
 */
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SeekOrigin {
    Begin,
    Current,
    End
};

/**
 * @brief Identifying name of a stream.
 *
 * Either nothing, a textual name (usually the path it was opened from) or
 * the descriptor number of a stream wrapped around an already-open handle.
 */
using StreamName = std::variant<std::monostate, std::string, int>;

/**
 * @brief Interface for a caller-owned byte stream.
 *
 * @details A stream tells which operations it exposes at all through
 * has_read(), has_seek() and has_write(). An exposed operation may still
 * fail at runtime (a file opened read-only refuses writes, a pipe refuses
 * seeks); it then throws StreamError. Calling an operation that is not
 * exposed throws StreamError as well.
 *
 * An implementation whose has_read(), has_seek() or has_write() returns
 * true must override read(), seek() or write() respectively; the base
 * versions always throw, so the validator would report the capability
 * as Faulty.
 *
 * Streams are not thread-safe; the owner serializes access.
 */
class IStream {
public:
    virtual ~IStream() = default;

    // --- exposed operations ---

    [[nodiscard]] virtual bool has_read() const noexcept { return false; }
    [[nodiscard]] virtual bool has_seek() const noexcept { return false; }
    [[nodiscard]] virtual bool has_write() const noexcept { return false; }

    /// @return False for streams that decode bytes to text (opened without 'b').
    [[nodiscard]] virtual bool is_binary() const noexcept { return true; }

    // --- operations ---

    /**
     * @brief Read up to @p size bytes from the current position.
     * @return The bytes read; shorter than @p size only at end of stream.
     */
    virtual std::vector<std::uint8_t> read(std::size_t size);

    /**
     * @brief Move the cursor.
     * @return The new absolute position.
     */
    virtual std::uint64_t seek(std::int64_t offset, SeekOrigin origin);

    /// @return The current position; needs a working seek().
    std::uint64_t tell() { return seek(0, SeekOrigin::Current); }

    /**
     * @brief Write @p data at the current position.
     * @return Number of bytes written.
     */
    virtual std::size_t write(std::span<const std::uint8_t> data);

    // --- description ---

    [[nodiscard]] virtual StreamName name() const { return {}; }

    /// @return Human-readable representation, used in diagnostics only.
    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace takiyasha

#endif // TAKIYASHA_STREAM_HPP
