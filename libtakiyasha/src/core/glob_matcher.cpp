#include "../../include/glob_matcher.hpp"
#include <optional>

namespace takiyasha {

namespace {

struct ClassMatch {
    std::size_t next; // pattern index after the closing ']'
    bool matched;
};

// pattern[open] is '['; nullopt when the class is never closed
std::optional<ClassMatch> match_class(const std::string_view pattern, const std::size_t open, const char c) noexcept {
    std::size_t i = open + 1;
    bool negate = false;
    if (i < pattern.size() && pattern[i] == '!') {
        negate = true;
        ++i;
    }

    const std::size_t first = i;
    const auto uc = static_cast<unsigned char>(c);
    bool matched = false;
    while (i < pattern.size() && (pattern[i] != ']' || i == first)) {
        const auto lo = static_cast<unsigned char>(pattern[i]);
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            const auto hi = static_cast<unsigned char>(pattern[i + 2]);
            if (lo <= uc && uc <= hi) {
                matched = true;
            }
            i += 3;
        } else {
            if (lo == uc) {
                matched = true;
            }
            ++i;
        }
    }

    if (i >= pattern.size()) {
        return std::nullopt;
    }
    return ClassMatch{ i + 1, matched != negate };
}

} // namespace

bool glob_match(const std::string_view name, const std::string_view pattern) noexcept {
    constexpr auto npos = std::string_view::npos;
    std::size_t n = 0;
    std::size_t p = 0;
    // resume point of the last '*': retry with it swallowing one more char
    std::size_t star_p = npos;
    std::size_t star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size()) {
            const char pc = pattern[p];
            if (pc == '*') {
                star_p = p++;
                star_n = n;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++n;
                continue;
            }
            if (pc == '[') {
                if (const auto cls = match_class(pattern, p, name[n])) {
                    if (cls->matched) {
                        p = cls->next;
                        ++n;
                        continue;
                    }
                } else if (name[n] == '[') {
                    ++p;
                    ++n;
                    continue;
                }
            } else if (pc == name[n]) {
                ++p;
                ++n;
                continue;
            }
        }
        if (star_p != npos) {
            p = star_p + 1;
            n = ++star_n;
            continue;
        }
        return false;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace takiyasha
