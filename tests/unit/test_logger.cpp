#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <motionline/logger.hpp>
#include <string>
#include <vector>

#include "timeline/timeline_model.hpp"

using namespace motionline;

namespace
{

// Captures records for one test and restores the logger afterwards.
class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Trace);
        Logger::instance().add_sink([this](const LogRecord& r) { records.push_back(r); });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().clear_category_levels();
        Logger::instance().set_level(LogLevel::Info);
    }

    std::vector<LogRecord> records;
};

}   // anonymous namespace

TEST(LoggerFormat, Placeholders)
{
    EXPECT_EQ(detail::format("segment {} at {}s", 3, 1.5), "segment 3 at 1.5s");
    EXPECT_EQ(detail::format("{} {}", std::string("a")), "a {}");
    EXPECT_EQ(detail::format("flag {}", true), "flag true");
    EXPECT_EQ(detail::format("no args"), "no args");
}

TEST(LoggerFormat, DoublesUseShortestForm)
{
    EXPECT_EQ(detail::format("{}", 0.1), "0.1");
    EXPECT_EQ(detail::format("{}", 2.0), "2");
    EXPECT_EQ(detail::format("{}", 0.1 + 0.2), "0.30000000000000004");
}

TEST(LoggerFormat, LevelNames)
{
    EXPECT_STREQ(log_level_name(LogLevel::Warning), "warning");
    EXPECT_STREQ(log_level_name(LogLevel::Off), "off");
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warning);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LoggerFormat, LineLayout)
{
    LogRecord r;
    r.time     = std::chrono::system_clock::now();
    r.level    = LogLevel::Critical;
    r.category = "clock";
    r.message  = "stalled";

    auto line = Logger::format_line(r);
    EXPECT_NE(line.find(" CRIT [clock] stalled"), std::string::npos);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[19], '.');
}

TEST_F(LoggerTest, LevelFiltering)
{
    Logger::instance().set_level(LogLevel::Warning);
    MOTIONLINE_LOG_INFO("timeline", "hidden");
    MOTIONLINE_LOG_WARN("timeline", "shown {}", 1);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Warning);
    EXPECT_EQ(records[0].category, "timeline");
    EXPECT_EQ(records[0].message, "shown 1");
}

TEST_F(LoggerTest, CategoryOverridesGlobalLevel)
{
    Logger::instance().set_level(LogLevel::Warning);
    Logger::instance().set_category_level("interaction", LogLevel::Debug);
    Logger::instance().set_category_level("easing", LogLevel::Off);

    MOTIONLINE_LOG_DEBUG("interaction", "press at {}", 12.5);
    MOTIONLINE_LOG_DEBUG("timeline", "hidden");
    MOTIONLINE_LOG_ERROR("easing", "hidden too");
    MOTIONLINE_LOG_WARN("timeline", "shown");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "press at 12.5");
    EXPECT_EQ(records[1].category, "timeline");

    Logger::instance().clear_category_levels();
    EXPECT_FALSE(Logger::instance().enabled(LogLevel::Debug, "interaction"));
    EXPECT_TRUE(Logger::instance().enabled(LogLevel::Error, "easing"));
}

TEST_F(LoggerTest, OffSilencesEverything)
{
    Logger::instance().set_level(LogLevel::Off);
    MOTIONLINE_LOG_CRITICAL("timeline", "dropped");
    EXPECT_TRUE(records.empty());
    EXPECT_EQ(Logger::instance().level(), LogLevel::Off);
}

TEST_F(LoggerTest, DurationShrinkWarns)
{
    TimelineModel model(10.0);
    model.add_segment(make_segment(6.0, 9.0));
    model.set_total_duration(5.0);

    bool warned = false;
    for (const auto& e : records)
    {
        if (e.level == LogLevel::Warning && e.category == "timeline")
            warned = true;
    }
    EXPECT_TRUE(warned);
}

TEST_F(LoggerTest, SinkManagement)
{
    EXPECT_EQ(Logger::instance().sink_count(), 1u);
    Logger::instance().add_sink(sinks::null_sink());
    EXPECT_EQ(Logger::instance().sink_count(), 2u);
    Logger::instance().clear_sinks();
    EXPECT_EQ(Logger::instance().sink_count(), 0u);
}

TEST_F(LoggerTest, FileSink)
{
    auto path = std::filesystem::temp_directory_path() / "motionline_test_log.txt";
    std::filesystem::remove(path);

    Logger::instance().add_sink(sinks::file_sink(path.string()));
    MOTIONLINE_LOG_ERROR("export", "cannot open '{}'", std::string("x.json"));

    std::ifstream f(path);
    std::string   line;
    ASSERT_TRUE(std::getline(f, line));
    EXPECT_NE(line.find("ERROR [export] cannot open 'x.json'"), std::string::npos);

    Logger::instance().clear_sinks();
    std::filesystem::remove(path);
}
