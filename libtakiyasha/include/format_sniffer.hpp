/**
 * @file format_sniffer.hpp
 * @brief Names the real content format of a buffer from its leading bytes.
 *
 * An empty result is a normal outcome ("unsupported"), never an error.
 */

#ifndef TAKIYASHA_FORMAT_SNIFFER_HPP
#define TAKIYASHA_FORMAT_SNIFFER_HPP

#include "header_registry.hpp"
#include "stream.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace takiyasha {

/**
 * @brief Label of the first registered magic (declaration order) that prefixes @p data.
 */
std::optional<std::string> identify_format(std::span<const std::uint8_t> data, FormatDomain domain);

/**
 * @brief Magic bytes registered for @p label.
 *
 * A single leading '.' is stripped first, so "flac" and ".flac" give the
 * same answer.
 */
std::optional<std::vector<std::uint8_t>> header_for_format(std::string_view label, FormatDomain domain);

/**
 * @brief Sniff a stream from its first bytes.
 *
 * Reads at most HeaderRegistry::max_magic_length() bytes from offset 0 and
 * leaves the cursor back at offset 0.
 *
 * @throws StreamError if the stream cannot seek or read.
 */
std::optional<std::string> identify_stream_format(IStream& stream, FormatDomain domain);

// shorthands for the two domains

inline std::optional<std::string> audio_format(const std::span<const std::uint8_t> data) {
    return identify_format(data, FormatDomain::Audio);
}

inline std::optional<std::string> image_mime(const std::span<const std::uint8_t> data) {
    return identify_format(data, FormatDomain::Image);
}

inline std::optional<std::vector<std::uint8_t>> possible_audio_header(const std::string_view format) {
    return header_for_format(format, FormatDomain::Audio);
}

inline std::optional<std::vector<std::uint8_t>> possible_image_header(const std::string_view mime) {
    return header_for_format(mime, FormatDomain::Image);
}

} // namespace takiyasha

#endif // TAKIYASHA_FORMAT_SNIFFER_HPP
