#ifndef TAKIYASHA_FILE_SCANNER_HPP
#define TAKIYASHA_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

/**
 * @brief Expands the command-line inputs into the list of files to probe.
 *
 * Directories are listed (recursively if asked), junk files such as
 * .DS_Store are skipped, and "-" is kept as is to stand for stdin.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    bool recursive);

#endif // TAKIYASHA_FILE_SCANNER_HPP
