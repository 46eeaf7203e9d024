/**
 * @file extension_classifier.hpp
 * @brief Maps file names to the encryption/container scheme that produced them.
 */

#ifndef TAKIYASHA_EXTENSION_CLASSIFIER_HPP
#define TAKIYASHA_EXTENSION_CLASSIFIER_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace takiyasha {

/**
 * @brief A scheme and the glob patterns of the file names it produces.
 */
struct SchemePatterns {
    std::string_view scheme;
    std::span<const std::string_view> patterns;
};

/**
 * @brief All known schemes ("ncm", then "qmc").
 *
 * Scheme order, then pattern order inside a scheme, decides which scheme
 * wins when several patterns match the same name.
 */
std::span<const SchemePatterns> supported_schemes() noexcept;

/**
 * @brief First scheme with a pattern matching the whole of @p name.
 *
 * @return e.g. "qmc" for "song.qmc3"; std::nullopt for "plain.mp3".
 */
std::optional<std::string> classify_by_name(std::string_view name);

/**
 * @brief Extension of the last path component, including the dot.
 *
 * Leading dots of the component do not start an extension, so ".bashrc"
 * has none. Returns an empty string when there is no extension.
 */
std::string file_extension(std::string_view name);

} // namespace takiyasha

#endif // TAKIYASHA_EXTENSION_CLASSIFIER_HPP
