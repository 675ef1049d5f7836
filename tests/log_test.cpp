#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <steptime.hpp>

using namespace steptime;

namespace {

class CaptureSink final : public LogSink {
public:
    std::vector<std::pair<LogLevel, std::string>> lines;

private:
    void send(LogLevel level, const char* msg) override { lines.emplace_back(level, msg); }
};

class LogTest : public ::testing::Test {
protected:
    void SetUp() override { console_level_ = log_sink().level(); }

    void TearDown() override {
        set_log_sink(nullptr);
        set_log_level(console_level_);
    }

    LogLevel console_level_ = LogLevel::warning;
};

} // namespace

TEST_F(LogTest, DefaultsToConsoleAtWarning) {
    EXPECT_EQ(&log_sink(), &detail::console_log_sink());
    EXPECT_EQ(log_sink().level(), LogLevel::warning);
    EXPECT_TRUE(log_sink().enabled(LogLevel::error));
    EXPECT_TRUE(log_sink().enabled(LogLevel::warning));
    EXPECT_FALSE(log_sink().enabled(LogLevel::info));
}

TEST_F(LogTest, LevelFiltering) {
    CaptureSink sink;
    sink.set_level(LogLevel::info);
    set_log_sink(&sink);

    log_message(LogLevel::error, "e");
    log_message(LogLevel::warning, "w");
    log_message(LogLevel::info, "i");
    log_message(LogLevel::debug, "d");

    ASSERT_EQ(sink.lines.size(), 3u);
    EXPECT_EQ(sink.lines[0], std::make_pair(LogLevel::error, std::string("e")));
    EXPECT_EQ(sink.lines[2], std::make_pair(LogLevel::info, std::string("i")));
}

TEST_F(LogTest, QuietSilencesEverything) {
    CaptureSink sink;
    sink.set_level(LogLevel::quiet);
    set_log_sink(&sink);
    log_message(LogLevel::error, "lost");
    EXPECT_TRUE(sink.lines.empty());

    // quiet is never an emitting level
    sink.set_level(LogLevel::debug);
    EXPECT_FALSE(sink.enabled(LogLevel::quiet));
}

TEST_F(LogTest, FormatsArguments) {
    CaptureSink sink;
    set_log_sink(&sink);
    log_message(LogLevel::warning, "dropped %llu steps (cap %u)", 10ULL, 5u);
    ASSERT_EQ(sink.lines.size(), 1u);
    EXPECT_EQ(sink.lines[0].second, "dropped 10 steps (cap 5)");
}

TEST_F(LogTest, LongMessagesTruncated) {
    CaptureSink sink;
    set_log_sink(&sink);
    const std::string long_text(1'000, 'x');
    log_message(LogLevel::error, "%s", long_text.c_str());
    ASSERT_EQ(sink.lines.size(), 1u);
    EXPECT_EQ(sink.lines[0].second.size(), 255u);
}

TEST_F(LogTest, SetLogLevelTargetsCurrentSink) {
    CaptureSink sink;
    set_log_sink(&sink);
    set_log_level(LogLevel::debug);
    EXPECT_EQ(sink.level(), LogLevel::debug);
    EXPECT_EQ(detail::console_log_sink().level(), console_level_);
}

TEST_F(LogTest, NullRestoresConsole) {
    NullLogSink null_sink;
    set_log_sink(&null_sink);
    EXPECT_EQ(&log_sink(), &null_sink);
    log_message(LogLevel::error, "discarded");

    set_log_sink(nullptr);
    EXPECT_EQ(&log_sink(), &detail::console_log_sink());
}

TEST_F(LogTest, ParseLogLevel) {
    EXPECT_EQ(*parse_log_level("quiet"), LogLevel::quiet);
    EXPECT_EQ(*parse_log_level("error"), LogLevel::error);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::warning);
    EXPECT_EQ(*parse_log_level("info"), LogLevel::info);
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::debug);

    auto bad = parse_log_level("verbose");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), TimeError::invalid_argument);
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_string(LogLevel::warning), "warning");
    EXPECT_STREQ(log_level_string(LogLevel::quiet), "quiet");
}
