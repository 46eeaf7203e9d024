#ifndef TAKIYASHA_REPORT_GENERATOR_HPP
#define TAKIYASHA_REPORT_GENERATOR_HPP

#include <filesystem>
#include <string>
#include <vector>

struct ProbeResult {
    std::string filename;      // path as given, or the stdin descriptor
    std::string extension;     // last dot-suffix, "" if none
    std::string scheme;        // encryption scheme by name, "" if none
    std::string audio_format;  // registry verdict, "" if none
    std::string image_mime;    // registry verdict, "" if none
    std::string magic_mime;    // libmagic verdict, "" if unavailable
    bool stream_ok{};          // every requested capability passed
    std::string error_msg;     // failed capability or I/O error
};

void print_console_report(const std::vector<ProbeResult>& results,
                          double total_seconds);

/**
 * @brief Writes one CSV row per result.
 * @return False if the file could not be written.
 */
bool export_csv_report(const std::vector<ProbeResult>& results,
                       const std::filesystem::path& output_path);

#endif // TAKIYASHA_REPORT_GENERATOR_HPP
