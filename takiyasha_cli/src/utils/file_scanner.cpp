#include "file_scanner.hpp"
#include "../../../libtakiyasha/include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace fs = std::filesystem;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db";
}

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const bool recursive) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        if (in == "-") {
            result.push_back(in);
            continue;
        }
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            const auto collect = [&](const fs::directory_entry& e) {
                if (e.is_regular_file(ec) && !is_junk(e.path()))
                    result.push_back(e.path());
            };
            if (recursive) {
                for (const auto& e : fs::recursive_directory_iterator(in, fs::directory_options::skip_permission_denied, ec))
                    collect(e);
            } else {
                for (const auto& e : fs::directory_iterator(in, fs::directory_options::skip_permission_denied, ec))
                    collect(e);
            }
            if (ec) {
                Logger::log(LogLevel::Warning, "Cannot list " + in.string() + " (" + ec.message() + ")", "scanner");
            }
        } else if (fs::is_regular_file(in, ec) && !is_junk(in)) {
            result.push_back(in);
        }
    }

    // directory iteration order is unspecified
    std::sort(result.begin(), result.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
