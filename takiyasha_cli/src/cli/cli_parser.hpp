#ifndef TAKIYASHA_CLI_PARSER_HPP
#define TAKIYASHA_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;
    bool check_write = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path report_path;
    std::filesystem::path magic_file;

    std::vector<std::filesystem::path> inputs;

    bool is_pipe = false;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // TAKIYASHA_CLI_PARSER_HPP
