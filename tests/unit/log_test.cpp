#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "coffer/diagnostics/Log.hpp"

namespace
{

struct CapturedLine
{
    coffer::diagnostics::LogLevel level;
    std::string text;
};

class LogTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_previous = coffer::diagnostics::logLevel();
        coffer::diagnostics::setLogSink([this](coffer::diagnostics::LogLevel level, std::string_view line)
                                        { m_lines.push_back(CapturedLine{ level, std::string{ line } }); });
    }

    void TearDown() override
    {
        coffer::diagnostics::setLogSink({});
        coffer::diagnostics::setLogLevel(m_previous);
    }

    std::vector<CapturedLine> m_lines;                                             // NOLINT
    coffer::diagnostics::LogLevel m_previous{ coffer::diagnostics::LogLevel::Warning }; // NOLINT
};

} // namespace

TEST_F(LogTest, FormatsTimestampLevelAndMessage)
{
    coffer::diagnostics::setLogLevel(coffer::diagnostics::LogLevel::Debug);
    coffer::diagnostics::info("vault unlocked: ", 3, " entries");

    ASSERT_EQ(m_lines.size(), 1U);
    EXPECT_EQ(m_lines[0].level, coffer::diagnostics::LogLevel::Info);
    EXPECT_THAT(m_lines[0].text, ::testing::MatchesRegex(R"(\[[0-9-]+T[0-9:.]+Z\] \[INFO\] vault unlocked: 3 entries)"));
}

TEST_F(LogTest, DropsMessagesBelowThreshold)
{
    coffer::diagnostics::setLogLevel(coffer::diagnostics::LogLevel::Warning);
    coffer::diagnostics::debug("hidden");
    coffer::diagnostics::info("hidden");
    coffer::diagnostics::warning("shown");
    coffer::diagnostics::error("shown too");

    ASSERT_EQ(m_lines.size(), 2U);
    EXPECT_EQ(m_lines[0].level, coffer::diagnostics::LogLevel::Warning);
    EXPECT_EQ(m_lines[1].level, coffer::diagnostics::LogLevel::Error);
}

TEST_F(LogTest, OffSilencesEverything)
{
    coffer::diagnostics::setLogLevel(coffer::diagnostics::LogLevel::Off);
    coffer::diagnostics::error("nothing");
    EXPECT_TRUE(m_lines.empty());
    EXPECT_FALSE(coffer::diagnostics::isEnabled(coffer::diagnostics::LogLevel::Error));
}

TEST(LogLevelNames, ParseAcceptsKnownNames)
{
    EXPECT_EQ(coffer::diagnostics::parseLogLevel("debug"), coffer::diagnostics::LogLevel::Debug);
    EXPECT_EQ(coffer::diagnostics::parseLogLevel("warn"), coffer::diagnostics::LogLevel::Warning);
    EXPECT_EQ(coffer::diagnostics::parseLogLevel("off"), coffer::diagnostics::LogLevel::Off);
    EXPECT_FALSE(coffer::diagnostics::parseLogLevel("verbose").has_value());
    EXPECT_EQ(coffer::diagnostics::toString(coffer::diagnostics::LogLevel::Warning), "WARN");
}
