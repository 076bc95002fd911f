#include <gtest/gtest.h>
#include "../libqshift/include/logger.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace qshift;

namespace {

struct Line {
    LogLevel level;
    std::string message;
    std::string tag;
};

class CaptureSink final : public ILogSink {
public:
    explicit CaptureSink(std::vector<Line>& lines) : lines_(lines) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        lines_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Line>& lines_;
};

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::clear_sinks();
        Logger::reset_counts();
    }

    void TearDown() override {
        Logger::clear_sinks();
        Logger::reset_counts();
    }
};

TEST_F(LoggerTest, EverySinkReceivesEachMessage) {
    std::vector<Line> first;
    std::vector<Line> second;
    Logger::add_sink(std::make_unique<CaptureSink>(first));
    Logger::add_sink(std::make_unique<CaptureSink>(second));
    Logger::add_sink(nullptr);

    Logger::log(LogLevel::Warning, "search metric ssim-all unavailable", "Search");

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0].level, LogLevel::Warning);
    EXPECT_EQ(first[0].message, "search metric ssim-all unavailable");
    EXPECT_EQ(second[0].tag, "Search");
}

TEST_F(LoggerTest, CountsPerLevelWithoutSinks) {
    Logger::log(LogLevel::Warning, "calibration discarded");
    Logger::log(LogLevel::Warning, "stalled encoder");
    Logger::log(LogLevel::Error, "rename failed");

    EXPECT_EQ(Logger::count(LogLevel::Warning), 2u);
    EXPECT_EQ(Logger::count(LogLevel::Error), 1u);
    EXPECT_EQ(Logger::count(LogLevel::Debug), 0u);

    Logger::reset_counts();
    EXPECT_EQ(Logger::count(LogLevel::Warning), 0u);
}

TEST_F(LoggerTest, LevelNamesRoundTripThroughTheOption) {
    EXPECT_FALSE(Logger::string_to_level("NONE").has_value());
    EXPECT_EQ(*Logger::string_to_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(*Logger::string_to_level("bogus"), LogLevel::Error);
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
}
