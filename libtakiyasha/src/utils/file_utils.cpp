#include "../../include/file_utils.hpp"
#include <system_error>

#ifdef _WIN32
#include <string>
#endif

namespace takiyasha {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen takes UTF-16 paths; the \\?\ prefix lifts MAX_PATH
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<std::uint8_t> read_to_end(IStream& stream, const std::size_t chunk_size) {
        std::vector<std::uint8_t> out;
        const std::size_t request = chunk_size == 0 ? 1 : chunk_size;
        for (;;) {
            auto chunk = stream.read(request);
            if (chunk.empty()) {
                break;
            }
            out.insert(out.end(), chunk.begin(), chunk.end());
        }
        return out;
    }

} // namespace takiyasha
