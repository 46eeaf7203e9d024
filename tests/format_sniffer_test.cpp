#include "format_sniffer.hpp"
#include "header_registry.hpp"
#include "memory_stream.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace takiyasha {
namespace {

    static std::vector<uint8_t> bytes_of(std::string_view s)
    {
        return std::vector<uint8_t>(s.begin(), s.end());
    }


    static void expect_domain_round_trips(FormatDomain domain)
    {
        const std::vector<uint8_t> suffix = { 0x00, 0xFF, 0x13, 0x37, 'x' };
        for (const auto& entry : HeaderRegistry::for_domain(domain).entries()) {
            auto data = bytes_of(entry.magic);
            data.insert(data.end(), suffix.begin(), suffix.end());

            const auto label = identify_format(data, domain);
            ASSERT_TRUE(label.has_value()) << entry.label;
            EXPECT_EQ(*label, entry.label);

            const auto header = header_for_format(entry.label, domain);
            ASSERT_TRUE(header.has_value()) << entry.label;
            EXPECT_EQ(*header, bytes_of(entry.magic));

            const auto dotted = header_for_format("." + std::string(entry.label), domain);
            EXPECT_EQ(dotted, header);
        }
    }


    TEST(FormatSniffer, AudioHeadersIdentifyWithAnySuffix)
    {
        expect_domain_round_trips(FormatDomain::Audio);
    }


    TEST(FormatSniffer, ImageHeadersIdentifyWithAnySuffix)
    {
        expect_domain_round_trips(FormatDomain::Image);
    }


    TEST(FormatSniffer, FlacMagic)
    {
        const auto data = bytes_of("fLaC streaminfo");
        EXPECT_EQ(audio_format(data), std::optional<std::string>("flac"));
        EXPECT_FALSE(image_mime(data).has_value());
    }


    TEST(FormatSniffer, EmptyAndShortBuffersAreUnknown)
    {
        const std::vector<uint8_t> empty;
        EXPECT_FALSE(identify_format(empty, FormatDomain::Audio).has_value());
        EXPECT_FALSE(identify_format(empty, FormatDomain::Image).has_value());

        // prefixes of real magics
        EXPECT_FALSE(audio_format(bytes_of("fLa")).has_value());
        EXPECT_FALSE(audio_format(bytes_of("ID")).has_value());
        EXPECT_FALSE(image_mime(std::vector<uint8_t> { 0x89, 'P', 'N', 'G' }).has_value());
    }


    TEST(FormatSniffer, UnknownBytesAreUnknown)
    {
        EXPECT_FALSE(audio_format(bytes_of("PK\x03\x04 not audio")).has_value());
        EXPECT_FALSE(image_mime(bytes_of("GIF89a")).has_value());
    }


    TEST(FormatSniffer, WmaGuidWithEmbeddedNul)
    {
        const std::vector<uint8_t> asf = { 0x30, 0x26, 0xB2, 0x75, 0x8E, 0x66,
                                           0xCF, 0x11, 0xA6, 0xD9, 0x00, 0xAA,
                                           0x00, 0x62, 0xCE, 0x6C, 0x01 };
        EXPECT_EQ(audio_format(asf), std::optional<std::string>("wma"));

        std::vector<uint8_t> truncated(asf.begin(), asf.begin() + 11);
        EXPECT_FALSE(audio_format(truncated).has_value());
    }


    TEST(FormatSniffer, ImageMimes)
    {
        EXPECT_EQ(image_mime(std::vector<uint8_t> { 0xFF, 0xD8, 0xFF, 0xE0 }),
                  std::optional<std::string>("image/jpeg"));
        EXPECT_EQ(image_mime(bytes_of("BM6")),
                  std::optional<std::string>("image/bmp"));
        // AAC ADTS starts with FF F1, not an image
        EXPECT_FALSE(image_mime(std::vector<uint8_t> { 0xFF, 0xF1, 0x50 }).has_value());
        EXPECT_EQ(audio_format(std::vector<uint8_t> { 0xFF, 0xF1, 0x50 }),
                  std::optional<std::string>("aac"));
    }


    TEST(FormatSniffer, HeaderForFormat)
    {
        EXPECT_EQ(possible_audio_header("flac"), bytes_of("fLaC"));
        EXPECT_EQ(possible_audio_header(".flac"), bytes_of("fLaC"));
        EXPECT_EQ(possible_audio_header("ape"), bytes_of("MAC "));
        EXPECT_EQ(possible_image_header("image/png"),
                  (std::vector<uint8_t> { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A }));

        EXPECT_FALSE(possible_audio_header("opus").has_value());
        EXPECT_FALSE(possible_audio_header("").has_value());
        EXPECT_FALSE(possible_audio_header(".").has_value());
        // only one leading dot is stripped
        EXPECT_FALSE(possible_audio_header("..flac").has_value());
        // domains are independent
        EXPECT_FALSE(possible_audio_header("image/png").has_value());
        EXPECT_FALSE(possible_image_header("flac").has_value());
    }


    TEST(FormatSniffer, VocabularyInDeclarationOrder)
    {
        std::vector<std::string> audio;
        for (const auto& e : audio_header_entries()) audio.emplace_back(e.label);
        EXPECT_EQ(audio, (std::vector<std::string> { "flac", "mp3", "ogg", "m4a", "wma",
                                                    "wav", "aac", "dff", "ape" }));

        std::vector<std::string> image;
        for (const auto& e : image_header_entries()) image.emplace_back(e.label);
        EXPECT_EQ(image, (std::vector<std::string> { "image/png", "image/jpeg", "image/bmp" }));

        EXPECT_EQ(HeaderRegistry::for_domain(FormatDomain::Audio).max_magic_length(), 16U);
        EXPECT_EQ(HeaderRegistry::for_domain(FormatDomain::Image).max_magic_length(), 8U);
    }


    TEST(HeaderRegistry, FirstDeclaredEntryWinsOnOverlap)
    {
        const HeaderEntry entries[] = {
            { "AB", "short" },
            { "ABC", "long" },
        };
        const HeaderRegistry registry(entries);
        EXPECT_EQ(registry.identify(bytes_of("ABCD")), std::optional<std::string_view>("short"));
        EXPECT_EQ(registry.magic_for("long"), std::optional<std::string_view>("ABC"));
    }


    TEST(HeaderRegistry, RejectsBrokenBijection)
    {
        const HeaderEntry duplicate_magic[] = {
            { "AB", "one" },
            { "AB", "two" },
        };
        EXPECT_THROW(HeaderRegistry { duplicate_magic }, std::invalid_argument);

        const HeaderEntry duplicate_label[] = {
            { "AB", "one" },
            { "CD", "one" },
        };
        EXPECT_THROW(HeaderRegistry { duplicate_label }, std::invalid_argument);

        const HeaderEntry empty_magic[] = {
            { "", "none" },
        };
        EXPECT_THROW(HeaderRegistry { empty_magic }, std::invalid_argument);
    }


    TEST(FormatSniffer, StreamIsRewoundAfterSniffing)
    {
        MemoryStream stream(bytes_of("OggS rest of the page"));
        stream.seek(0, SeekOrigin::End);

        EXPECT_EQ(identify_stream_format(stream, FormatDomain::Audio),
                  std::optional<std::string>("ogg"));
        EXPECT_EQ(stream.position(), 0U);
        EXPECT_FALSE(identify_stream_format(stream, FormatDomain::Image).has_value());
    }


    TEST(FormatSniffer, EmptyStreamIsUnknown)
    {
        MemoryStream stream;
        EXPECT_FALSE(identify_stream_format(stream, FormatDomain::Audio).has_value());
    }

}  // namespace
}  // namespace takiyasha
