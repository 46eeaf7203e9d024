#ifndef TAKIYASHA_MIME_DETECTOR_HPP
#define TAKIYASHA_MIME_DETECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>

namespace takiyasha {

    /**
     * @brief libmagic-based MIME detection.
     *
     * Independent of the HeaderRegistry: it covers formats the registry does
     * not know, and front-ends show it beside the registry's verdict so an
     * unsupported file can still be told apart from a broken one.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         * @return e.g. "audio/flac", or an empty string if libmagic failed.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @return e.g. "image/png", or an empty string if libmagic failed.
         */
        static std::string detect(std::span<const std::uint8_t> data);

        /**
         * @brief Use a specific compiled magic database (.mgc).
         *
         * An empty path restores libmagic's default lookup, which honours
         * the MAGIC environment variable.
         */
        static void set_magic_database(const std::filesystem::path& path);

        static std::filesystem::path magic_database();

    private:
        static std::filesystem::path database_;
        static std::mutex mtx_;
    };

} // namespace takiyasha

#endif // TAKIYASHA_MIME_DETECTOR_HPP
