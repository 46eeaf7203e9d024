#ifndef TAKIYASHA_GLOB_MATCHER_HPP
#define TAKIYASHA_GLOB_MATCHER_HPP

#include <string_view>

namespace takiyasha {

/**
 * @brief Shell-style wildcard match of a whole file name.
 *
 * Supported syntax:
 * - `*` any run of characters, including an empty one and '/'
 * - `?` exactly one character
 * - `[abc]`, `[a-z]` a character class; `[!...]` its negation
 *
 * A ']' directly after '[' or '[!' belongs to the class. A '[' without a
 * closing ']' is an ordinary character. There is no escape character.
 * Matching is case-sensitive and anchored at both ends.
 */
[[nodiscard]] bool glob_match(std::string_view name, std::string_view pattern) noexcept;

} // namespace takiyasha

#endif // TAKIYASHA_GLOB_MATCHER_HPP
