#ifndef TAKIYASHA_FILE_UTILS_HPP
#define TAKIYASHA_FILE_UTILS_HPP

#include "stream.hpp"
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace takiyasha {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a stream from its current position to end of stream.
     *
     * Used for sources that cannot seek (stdin), where the content has to
     * be buffered before it can be sniffed.
     *
     * @param stream A readable stream.
     * @param chunk_size Bytes requested per read() call.
     * @return Everything that was left in the stream.
     */
    std::vector<std::uint8_t> read_to_end(IStream &stream, std::size_t chunk_size = 64 * 1024);

} // namespace takiyasha

#endif // TAKIYASHA_FILE_UTILS_HPP
