#include "../../include/format_sniffer.hpp"

namespace takiyasha {

std::optional<std::string> identify_format(const std::span<const std::uint8_t> data, const FormatDomain domain) {
    const auto label = HeaderRegistry::for_domain(domain).identify(data);
    if (!label) {
        return std::nullopt;
    }
    return std::string(*label);
}

std::optional<std::vector<std::uint8_t>> header_for_format(std::string_view label, const FormatDomain domain) {
    if (!label.empty() && label.front() == '.') {
        label.remove_prefix(1);
    }
    const auto magic = HeaderRegistry::for_domain(domain).magic_for(label);
    if (!magic) {
        return std::nullopt;
    }
    return std::vector<std::uint8_t>(magic->begin(), magic->end());
}

std::optional<std::string> identify_stream_format(IStream& stream, const FormatDomain domain) {
    const auto& registry = HeaderRegistry::for_domain(domain);
    stream.seek(0, SeekOrigin::Begin);
    const auto prefix = stream.read(registry.max_magic_length());
    stream.seek(0, SeekOrigin::Begin);

    const auto label = registry.identify(prefix);
    if (!label) {
        return std::nullopt;
    }
    return std::string(*label);
}

} // namespace takiyasha
