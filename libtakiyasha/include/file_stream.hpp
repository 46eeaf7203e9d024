/**
 * @file file_stream.hpp
 * @brief IStream over a C stdio FILE handle.
 */

#ifndef TAKIYASHA_FILE_STREAM_HPP
#define TAKIYASHA_FILE_STREAM_HPP

#include "stream.hpp"
#include <cstdio>
#include <filesystem>
#include <string>

namespace takiyasha {

/**
 * @brief Stream backed by a FILE*.
 *
 * @details Like a regular file object, a FileStream always exposes read,
 * seek and write; the fopen mode decides which of them work. A stream
 * opened "rb" throws on write(), one opened "r" is a text stream
 * (is_binary() is false), and a FileStream wrapping a pipe throws on seek().
 */
class FileStream final : public IStream {
public:
    /**
     * @brief Open @p path with the fopen-style @p mode.
     * @throws StreamError if the file cannot be opened.
     */
    FileStream(const std::filesystem::path& path, const std::string& mode);

    /**
     * @brief Wrap an already-open handle (e.g. stdin). The stream is named
     * by the handle's descriptor number.
     * @param owns Close @p file on destruction.
     */
    FileStream(std::FILE* file, const std::string& mode, bool owns);

    ~FileStream() override;

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    [[nodiscard]] bool has_read() const noexcept override { return true; }
    [[nodiscard]] bool has_seek() const noexcept override { return true; }
    [[nodiscard]] bool has_write() const noexcept override { return true; }
    [[nodiscard]] bool is_binary() const noexcept override { return binary_; }

    std::vector<std::uint8_t> read(std::size_t size) override;
    std::uint64_t seek(std::int64_t offset, SeekOrigin origin) override;
    std::size_t write(std::span<const std::uint8_t> data) override;

    [[nodiscard]] StreamName name() const override { return name_; }
    [[nodiscard]] std::string describe() const override;

private:
    void parse_mode(const std::string& mode);

    std::FILE* file_ = nullptr;
    bool owns_ = true;
    bool readable_ = false;
    bool writable_ = false;
    bool binary_ = false;
    std::string mode_;
    StreamName name_;
};

} // namespace takiyasha

#endif // TAKIYASHA_FILE_STREAM_HPP
