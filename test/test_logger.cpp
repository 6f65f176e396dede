#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "logger.h"

using namespace poolq::core;

TEST(logger, parses_levels) {
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("2"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("verbose", LogLevel::Warn), LogLevel::Warn);
    EXPECT_STREQ(log_level_tag(LogLevel::Warn), "[WRN]");
}

TEST(logger, filters_by_level_and_formats_fields) {
    std::vector<std::pair<LogLevel, std::string>> got;
    Logger log(LogLevel::Info, "[t] ", [&got](LogLevel l, const std::string& line) { got.emplace_back(l, line); });

    log.debug("hidden");
    log.info("visible");
    log.log(LogLevel::Warn, "with fields", {{"k", "v"}, {"", "skipped"}, {"n", "1"}});

    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].first, LogLevel::Info);
    EXPECT_EQ(got[0].second, "[t] [INF] visible");
    EXPECT_EQ(got[1].first, LogLevel::Warn);
    EXPECT_EQ(got[1].second, "[t] [WRN] with fields k=v n=1");

    log.set_level(LogLevel::Debug);
    log.debug("now shown");
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[2].second, "[t] [DBG] now shown");
}

TEST(logger, prefix_can_change) {
    std::vector<std::string> got;
    Logger log(LogLevel::Error, "", [&got](LogLevel, const std::string& line) { got.push_back(line); });
    log.set_prefix("[x] ");
    EXPECT_EQ(log.prefix(), "[x] ");
    log.warn("dropped");
    log.error("kept");
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], "[x] [ERR] kept");
}
