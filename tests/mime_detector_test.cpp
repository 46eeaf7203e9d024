#include "logger.hpp"
#include "mime_detector.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace takiyasha {
namespace {

    class CaptureSink final : public ILogSink {
    public:
        explicit CaptureSink(std::vector<std::string>& out)
            : out_(out)
        {
        }

        void log(LogLevel level, std::string_view message, std::string_view tag) override
        {
            out_.push_back(std::string(Logger::level_to_string(level)) + "|" + std::string(tag) + "|"
                           + std::string(message));
        }

    private:
        std::vector<std::string>& out_;
    };


    static const std::vector<uint8_t> kPng = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D,
        0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
        0x08, 0x06, 0x00, 0x00, 0x00, 0x1F, 0x15, 0xC4, 0x89,
    };


    TEST(MimeDetector, DetectsBuffer)
    {
        EXPECT_EQ(MimeDetector::detect(kPng), "image/png");
    }


    TEST(MimeDetector, DetectsFile)
    {
        const auto path = std::filesystem::temp_directory_path() / "takiyasha_mime.png";
        {
            std::ofstream out(path, std::ios::binary);
            out.write(reinterpret_cast<const char*>(kPng.data()),
                      static_cast<std::streamsize>(kPng.size()));
        }
        EXPECT_EQ(MimeDetector::detect(path), "image/png");
        std::filesystem::remove(path);
    }


    TEST(MimeDetector, BrokenDatabaseLogsAndReturnsEmpty)
    {
        std::vector<std::string> messages;
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<CaptureSink>(messages));

        MimeDetector::set_magic_database("/nonexistent/takiyasha.mgc");
        EXPECT_EQ(MimeDetector::magic_database(), std::filesystem::path("/nonexistent/takiyasha.mgc"));
        EXPECT_EQ(MimeDetector::detect(kPng), "");

        MimeDetector::set_magic_database({});
        Logger::clear_sinks();

        ASSERT_FALSE(messages.empty());
        EXPECT_EQ(messages.front().rfind("WARN|libmagic|magic_load failed", 0), 0U);
        EXPECT_EQ(MimeDetector::detect(kPng), "image/png");
    }


    TEST(Logger, FansOutToAllSinks)
    {
        std::vector<std::string> first;
        std::vector<std::string> second;
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<CaptureSink>(first));
        Logger::add_sink(std::make_unique<CaptureSink>(second));
        Logger::add_sink(nullptr);

        Logger::log(LogLevel::Info, "probing");
        Logger::log(LogLevel::Error, "gone", "probe");
        Logger::clear_sinks();
        Logger::log(LogLevel::Error, "dropped");

        const std::vector<std::string> expected = { "INFO|takiyasha|probing", "ERROR|probe|gone" };
        EXPECT_EQ(first, expected);
        EXPECT_EQ(second, expected);
    }


    TEST(Logger, ThresholdDropsLowerLevels)
    {
        std::vector<std::string> messages;
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<CaptureSink>(messages));
        ASSERT_EQ(Logger::threshold(), LogLevel::Debug);

        Logger::set_threshold(LogLevel::Warning);
        Logger::log(LogLevel::Debug, "capability detail", "StreamValidator");
        Logger::log(LogLevel::Info, "opened");
        Logger::log(LogLevel::Warning, "seek faulty", "probe");
        Logger::log(LogLevel::Error, "gone", "probe");

        Logger::set_threshold(LogLevel::Debug);
        Logger::log(LogLevel::Debug, "detail", "StreamValidator");
        Logger::clear_sinks();

        const std::vector<std::string> expected = {
            "WARN|probe|seek faulty",
            "ERROR|probe|gone",
            "DEBUG|StreamValidator|detail",
        };
        EXPECT_EQ(messages, expected);
    }


    TEST(Logger, LevelNames)
    {
        EXPECT_EQ(Logger::string_to_level("DEBUG"), LogLevel::Debug);
        EXPECT_EQ(Logger::string_to_level("INFO"), LogLevel::Info);
        EXPECT_EQ(Logger::string_to_level("WARNING"), LogLevel::Warning);
        EXPECT_EQ(Logger::string_to_level("WARN"), LogLevel::Warning);
        EXPECT_EQ(Logger::string_to_level("ERROR"), LogLevel::Error);
        EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Error);
        EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    }

}  // namespace
}  // namespace takiyasha
