#include "../../include/header_registry.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace takiyasha {

using namespace std::string_view_literals;

namespace {

// declaration order is lookup order
constexpr HeaderEntry kAudioHeaders[] = {
    { "fLaC"sv, "flac"sv },
    { "ID3"sv,  "mp3"sv },
    { "OggS"sv, "ogg"sv },
    { "ftyp"sv, "m4a"sv },
    // ASF header object GUID
    { "\x30\x26\xB2\x75\x8E\x66\xCF\x11\xA6\xD9\x00\xAA\x00\x62\xCE\x6C"sv, "wma"sv },
    { "RIFF"sv, "wav"sv },
    { "\xFF\xF1"sv, "aac"sv },
    { "FRM8"sv, "dff"sv },
    { "MAC "sv, "ape"sv },
};

constexpr HeaderEntry kImageHeaders[] = {
    { "\x89\x50\x4E\x47\x0D\x0A\x1A\x0A"sv, "image/png"sv },
    { "\xFF\xD8\xFF"sv,                     "image/jpeg"sv },
    { "\x42\x4D"sv,                         "image/bmp"sv },
};

} // namespace

std::span<const HeaderEntry> audio_header_entries() noexcept {
    return kAudioHeaders;
}

std::span<const HeaderEntry> image_header_entries() noexcept {
    return kImageHeaders;
}

HeaderRegistry::HeaderRegistry(const std::span<const HeaderEntry> entries)
    : entries_(entries.begin(), entries.end()) {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        if (entry.magic.empty()) {
            throw std::invalid_argument("Empty magic for label '" + std::string(entry.label) + "'");
        }
        const bool duplicate_magic = std::any_of(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(i),
                                                 [&](const HeaderEntry& other) { return other.magic == entry.magic; });
        if (duplicate_magic) {
            throw std::invalid_argument("Magic registered twice (second label '" + std::string(entry.label) + "')");
        }
        if (!by_label_.emplace(entry.label, i).second) {
            throw std::invalid_argument("Label registered twice: '" + std::string(entry.label) + "'");
        }
        max_magic_length_ = std::max(max_magic_length_, entry.magic.size());
    }
}

const HeaderRegistry& HeaderRegistry::for_domain(const FormatDomain domain) {
    static const HeaderRegistry audio(audio_header_entries());
    static const HeaderRegistry image(image_header_entries());
    return domain == FormatDomain::Audio ? audio : image;
}

std::optional<std::string_view>
HeaderRegistry::identify(const std::span<const std::uint8_t> data) const noexcept {
    for (const auto& entry : entries_) {
        if (data.size() >= entry.magic.size() &&
            std::memcmp(data.data(), entry.magic.data(), entry.magic.size()) == 0) {
            return entry.label;
        }
    }
    return std::nullopt;
}

std::optional<std::string_view> HeaderRegistry::magic_for(const std::string_view label) const {
    const auto it = by_label_.find(label);
    if (it == by_label_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].magic;
}

} // namespace takiyasha
