#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", TAKIYASHA_VERSION);

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress the console report and console logging.");

    app.add_flag("--check-write", settings.check_write,
                 "Open inputs read-write and also require the write capability.");

    // --- Options ---
    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--magic-file", settings.magic_file,
                   "Compiled libmagic database to use instead of the system one.")
                   ->check(CLI::ExistingFile);

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more files or directories (use '-' for stdin)")
        ->required()
        ->check([](const std::string& str) {
            if (str == "-") return std::string();
            if (!std::filesystem::exists(str)) return "Input path '" + str + "' not found.";
            return std::string();
        });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        for (const auto& path : settings.inputs) {
            if (path == "-") {
                settings.is_pipe = true;
                break;
            }
        }

        if (settings.is_pipe && settings.inputs.size() > 1) {
            throw CLI::ValidationError("Cannot use stdin ('-') with other input files.");
        }

        if (settings.is_pipe && settings.check_write) {
            throw CLI::ValidationError("--check-write cannot be used with stdin ('-').");
        }
    });
}
