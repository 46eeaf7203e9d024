#include "report_generator.hpp"
#include "../../../libtakiyasha/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"');
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string or_dash(const std::string& s) {
    return s.empty() ? "-" : s;
}

void print_console_report(const std::vector<ProbeResult>& results,
                          const double total_seconds) {
    const bool use_colors = is_stdout_a_tty();

    size_t w_file = 4, w_ext = 3, w_scheme = 6, w_audio = 5, w_image = 5, w_magic = 7;
    for (const auto& r : results) {
        w_file   = std::max(w_file,   r.filename.size());
        w_ext    = std::max(w_ext,    or_dash(r.extension).size());
        w_scheme = std::max(w_scheme, or_dash(r.scheme).size());
        w_audio  = std::max(w_audio,  or_dash(r.audio_format).size());
        w_image  = std::max(w_image,  or_dash(r.image_mime).size());
        w_magic  = std::max(w_magic,  or_dash(r.magic_mime).size());
    }

    const auto cell = [](const std::string& s, const size_t w) {
        std::ostringstream oss;
        oss << std::left << std::setw(static_cast<int>(w)) << s << "  ";
        return oss.str();
    };

    std::cout << cell("File", w_file) << cell("Ext", w_ext) << cell("Scheme", w_scheme)
              << cell("Audio", w_audio) << cell("Image", w_image) << cell("libmagic", w_magic)
              << "Stream" << "\n";

    for (const auto& r : results) {
        std::string outcome;
        if (r.stream_ok) {
            outcome = use_colors ? "\033[1;32mOK\033[0m" : "OK";
        } else {
            outcome = use_colors ? "\033[1;31mFAIL\033[0m" : "FAIL";
            outcome += " (" + r.error_msg + ")";
        }
        std::cout << cell(r.filename, w_file) << cell(or_dash(r.extension), w_ext)
                  << cell(or_dash(r.scheme), w_scheme) << cell(or_dash(r.audio_format), w_audio)
                  << cell(or_dash(r.image_mime), w_image) << cell(or_dash(r.magic_mime), w_magic)
                  << outcome << "\n";
    }

    std::cout << "\nProbed " << results.size() << " file(s) in "
              << std::fixed << std::setprecision(2) << total_seconds << "s" << std::endl;
}

bool export_csv_report(const std::vector<ProbeResult>& results,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path, std::ios::trunc);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report to " + output_path.string(), "report");
        return false;
    }

    out << "file,extension,scheme,audio_format,image_mime,magic_mime,stream_ok,error\n";
    for (const auto& r : results) {
        out << csv_escape(r.filename) << ','
            << csv_escape(r.extension) << ','
            << csv_escape(r.scheme) << ','
            << csv_escape(r.audio_format) << ','
            << csv_escape(r.image_mime) << ','
            << csv_escape(r.magic_mime) << ','
            << (r.stream_ok ? "true" : "false") << ','
            << csv_escape(r.error_msg) << '\n';
    }

    Logger::log(LogLevel::Info, "Report written to " + output_path.string(), "report");
    return static_cast<bool>(out);
}
