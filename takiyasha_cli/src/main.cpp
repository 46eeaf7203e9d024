#include <chrono>
#include <filesystem>
#include <iostream>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "utils/probe_runner.hpp"
#include "../../libtakiyasha/include/logger.hpp"
#include "../../libtakiyasha/include/mime_detector.hpp"

int main(int argc, char* argv[]) {

    CLI::App app{"takiyasha: identify encrypted and plain media files."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    Logger::clear_sinks();
    // a log file records everything, the console only the chosen level
    const LogLevel console_level = Logger::string_to_level(settings.log_level);
    Logger::set_threshold(settings.log_file.empty() ? console_level : LogLevel::Debug);
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!file_sink->is_open()) {
            std::cerr << "Cannot open log file " << settings.log_file.string() << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(file_sink));
    }
    if (!settings.quiet && settings.log_level != "NONE") {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = console_level;
        Logger::add_sink(std::move(console_sink));
    }

    if (!settings.magic_file.empty()) {
        takiyasha::MimeDetector::set_magic_database(settings.magic_file);
        Logger::log(LogLevel::Info, "Using magic database " + settings.magic_file.string(), "main");
    }

    const auto inputs = collect_input_files(settings.inputs, settings.recursive);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    const auto start = std::chrono::steady_clock::now();
    std::vector<ProbeResult> results;
    results.reserve(inputs.size());

    for (const auto& input : inputs) {
        try {
            results.push_back(probe_input(input, settings.check_write));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, input.string() + ": " + e.what(), "main");
            ProbeResult failed;
            failed.filename = input.string();
            failed.error_msg = e.what();
            results.push_back(std::move(failed));
        }
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (!settings.quiet) {
        print_console_report(results, total_seconds);
    }

    if (!settings.report_path.empty() && !export_csv_report(results, settings.report_path)) {
        return 1;
    }
    return 0;
}
