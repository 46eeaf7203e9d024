#ifndef TAKIYASHA_PROBE_RUNNER_HPP
#define TAKIYASHA_PROBE_RUNNER_HPP

#include "../report/report_generator.hpp"
#include <filesystem>

/**
 * @brief Runs every classifier of libtakiyasha on one input.
 *
 * @param input A file path, or "-" for stdin.
 * @param check_write Open read-write and require the write capability too.
 * @return The verdicts; I/O failures end up in ProbeResult::error_msg.
 */
ProbeResult probe_input(const std::filesystem::path& input, bool check_write);

#endif // TAKIYASHA_PROBE_RUNNER_HPP
