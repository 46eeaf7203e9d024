/**
 * @file header_registry.hpp
 * @brief Magic-byte tables for the audio and image formats takiyasha recognizes.
 *
 * Each domain has exactly one canonical, ordered list of (magic, label)
 * pairs. The forward (magic -> label) scan and the reverse
 * (label -> magic) lookup are both derived from that list, so the two
 * directions cannot drift apart.
 */

#ifndef TAKIYASHA_HEADER_REGISTRY_HPP
#define TAKIYASHA_HEADER_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace takiyasha {

/**
 * @brief The two independent label vocabularies.
 */
enum class FormatDomain {
    Audio, ///< Labels are short codec names ("flac", "mp3", ...)
    Image  ///< Labels are MIME strings ("image/png", ...)
};

/**
 * @brief One registry row: a magic byte prefix and the label it identifies.
 *
 * The magic is kept in a string_view so that entries can live in constexpr
 * tables; it may contain NUL bytes.
 */
struct HeaderEntry {
    std::string_view magic;
    std::string_view label;
};

/**
 * @brief Bijective magic <-> label lookup for one domain.
 *
 * Iteration order is the declaration order of the canonical list. When
 * two magics could both prefix the same buffer, the earlier entry wins.
 */
class HeaderRegistry {
public:
    /**
     * @brief Build both lookup directions from a canonical list.
     * @throws std::invalid_argument on an empty magic, a duplicate magic
     * or a duplicate label.
     */
    explicit HeaderRegistry(std::span<const HeaderEntry> entries);

    /// @return The built-in registry for @p domain.
    static const HeaderRegistry& for_domain(FormatDomain domain);

    /**
     * @brief First entry (in declaration order) whose magic prefixes @p data.
     * @return The entry's label, or std::nullopt (also for short or empty data).
     */
    [[nodiscard]] std::optional<std::string_view>
    identify(std::span<const std::uint8_t> data) const noexcept;

    /**
     * @brief Reverse lookup. @p label must already be normalized.
     */
    [[nodiscard]] std::optional<std::string_view>
    magic_for(std::string_view label) const;

    [[nodiscard]] const std::vector<HeaderEntry>& entries() const noexcept { return entries_; }

    /// @return Length of the longest magic; the most bytes identify() ever inspects.
    [[nodiscard]] std::size_t max_magic_length() const noexcept { return max_magic_length_; }

private:
    std::vector<HeaderEntry> entries_;
    std::unordered_map<std::string_view, std::size_t> by_label_;
    std::size_t max_magic_length_ = 0;
};

/// @return The canonical audio list: flac, mp3, ogg, m4a, wma, wav, aac, dff, ape.
std::span<const HeaderEntry> audio_header_entries() noexcept;

/// @return The canonical image list: image/png, image/jpeg, image/bmp.
std::span<const HeaderEntry> image_header_entries() noexcept;

} // namespace takiyasha

#endif // TAKIYASHA_HEADER_REGISTRY_HPP
