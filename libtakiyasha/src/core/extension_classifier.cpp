#include "../../include/extension_classifier.hpp"
#include "../../include/glob_matcher.hpp"

namespace takiyasha {

using namespace std::string_view_literals;

namespace {

constexpr std::string_view kNcmPatterns[] = {
    "*.ncm"sv,
};

constexpr std::string_view kQmcPatterns[] = {
    "*.qmc[023468]"sv, "*.qmcflac"sv, "*.qmcogg"sv,
    "*.tkm"sv,
    "*.mflac"sv, "*.mflac[0]"sv, "*.mgg"sv, "*.mgg[01l]"sv,
    "*.bkcmp3"sv, "*.bkcm4a"sv, "*.bkcflac"sv, "*.bkcwav"sv, "*.bkcape"sv, "*.bkcogg"sv, "*.bkcwma"sv,
};

const SchemePatterns kSchemes[] = {
    { "ncm"sv, kNcmPatterns },
    { "qmc"sv, kQmcPatterns },
};

} // namespace

std::span<const SchemePatterns> supported_schemes() noexcept {
    return kSchemes;
}

std::optional<std::string> classify_by_name(const std::string_view name) {
    for (const auto& entry : kSchemes) {
        for (const auto pattern : entry.patterns) {
            if (glob_match(name, pattern)) {
                return std::string(entry.scheme);
            }
        }
    }
    return std::nullopt;
}

std::string file_extension(const std::string_view name) {
#ifdef _WIN32
    const auto sep = name.find_last_of("/\\");
#else
    const auto sep = name.find_last_of('/');
#endif
    const std::size_t base = sep == std::string_view::npos ? 0 : sep + 1;

    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot < base) {
        return {};
    }
    // the dot must follow at least one non-dot character of the component
    const auto first_non_dot = name.find_first_not_of('.', base);
    if (first_non_dot == std::string_view::npos || dot < first_non_dot) {
        return {};
    }
    return std::string(name.substr(dot));
}

} // namespace takiyasha
