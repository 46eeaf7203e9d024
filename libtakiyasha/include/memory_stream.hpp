/**
 * @file memory_stream.hpp
 * @brief In-memory IStream over a growable byte buffer.
 */

#ifndef TAKIYASHA_MEMORY_STREAM_HPP
#define TAKIYASHA_MEMORY_STREAM_HPP

#include "stream.hpp"
#include <string>

namespace takiyasha {

class MemoryStream final : public IStream {
public:
    MemoryStream() = default;

    /**
     * @param data Initial content; the cursor starts at offset 0.
     * @param read_only Reject writes (write() throws StreamError).
     */
    explicit MemoryStream(std::vector<std::uint8_t> data, bool read_only = false);

    [[nodiscard]] bool has_read() const noexcept override { return true; }
    [[nodiscard]] bool has_seek() const noexcept override { return true; }
    [[nodiscard]] bool has_write() const noexcept override { return true; }

    std::vector<std::uint8_t> read(std::size_t size) override;
    std::uint64_t seek(std::int64_t offset, SeekOrigin origin) override;

    /// Overwrites from the cursor, growing (zero-filled) past the end if needed.
    std::size_t write(std::span<const std::uint8_t> data) override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return data_; }
    [[nodiscard]] std::uint64_t position() const noexcept { return pos_; }

private:
    std::vector<std::uint8_t> data_;
    std::uint64_t pos_ = 0;
    bool read_only_ = false;
};

} // namespace takiyasha

#endif // TAKIYASHA_MEMORY_STREAM_HPP
