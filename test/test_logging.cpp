// test/test_logging.cpp

#include <gtest/gtest.h>
#include "racetrack/utils/logging.hpp"
#include "racetrack/utils/time_utils.hpp"
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace racetrack;
using namespace racetrack::logging;

namespace {

// 受け取ったメッセージを保持するシンク
class CaptureSink : public LogSink {
public:
    void write(const LogMessage& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(msg);
    }

    void flush() override {}

    std::vector<LogMessage> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::mutex mutex_;
    std::vector<LogMessage> messages_;
};

}  // namespace

class LoggingTest : public ::testing::Test {
protected:
    std::shared_ptr<CaptureSink> sink;
    std::unique_ptr<AsyncLogger> logger;

    void SetUp() override {
        sink = std::make_shared<CaptureSink>();
        logger = std::make_unique<AsyncLogger>();
        logger->add_sink(sink);
    }

    void TearDown() override {
        logger->stop();
    }
};

// TEST 1: レベル名の解析
TEST_F(LoggingTest, ParseLevel) {
    EXPECT_EQ(parse_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_level("Warn"), LogLevel::WARN);
    EXPECT_EQ(parse_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_level("fatal"), LogLevel::FATAL);
    EXPECT_FALSE(parse_level("verbose").has_value());
    EXPECT_EQ(get_level_string(LogLevel::WARN), "WARN");
}

// TEST 2: レベル未満のメッセージは出力されない
TEST_F(LoggingTest, MessagesBelowLevelAreDropped) {
    // Given: WARN以上を出力
    logger->set_level(LogLevel::WARN);

    // When: INFOとERRORを出力
    logger->log(LogLevel::INFO, "test", "dropped", __FILE__, __LINE__);
    logger->log(LogLevel::ERROR, "test", "kept", __FILE__, __LINE__);
    logger->flush();

    // Then: ERRORのみ受信
    auto messages = sink->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].message, "kept");
    EXPECT_EQ(messages[0].category, "test");
    EXPECT_EQ(messages[0].level, LogLevel::ERROR);
}

// TEST 3: 出力順序の保持
TEST_F(LoggingTest, MessagesKeepOrder) {
    for (int i = 0; i < 100; ++i) {
        logger->log(LogLevel::INFO, "order", std::to_string(i), __FILE__, __LINE__);
    }
    logger->flush();

    auto messages = sink->messages();
    ASSERT_EQ(messages.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(messages[i].message, std::to_string(i));
    }
}

// TEST 4: 停止後は同期出力
TEST_F(LoggingTest, LogAfterStopIsWrittenSynchronously) {
    logger->stop();
    logger->log(LogLevel::WARN, "stopped", "late message", __FILE__, __LINE__);

    auto messages = sink->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].message, "late message");
}

// TEST 5: メッセージの書式
TEST_F(LoggingTest, FormatMessage) {
    // Given: WARNメッセージ
    LogMessage msg;
    msg.level = LogLevel::WARN;
    msg.timestamp = "2024-01-01 00:00:00.000";
    msg.category = "search";
    msg.message = "No plan found";
    msg.file = "/path/to/path_search.cpp";
    msg.line = 42;

    // When: 書式化
    const std::string text = format_message(msg);

    // Then: レベル・カテゴリ・発生箇所を含む
    EXPECT_EQ(text, "[2024-01-01 00:00:00.000] [WARN] [search] No plan found (path_search.cpp:42)");

    // INFOは発生箇所なし
    msg.level = LogLevel::INFO;
    EXPECT_EQ(format_message(msg), "[2024-01-01 00:00:00.000] [INFO] [search] No plan found");
}

// TEST 6: printf形式のフォーマット
TEST_F(LoggingTest, FormatString) {
    EXPECT_EQ(format_string("Vehicle %c at %d,%d", 'a', 3, -4), "Vehicle a at 3,-4");
    EXPECT_EQ(format_string("%zu states in %.1f ms", static_cast<std::size_t>(12), 2.5),
              "12 states in 2.5 ms");
}

// TEST 7: ファイル出力
TEST_F(LoggingTest, FileSinkWritesLines) {
    // Given: 一時ファイルへのシンク
    const std::string path = ::testing::TempDir() + "racetrack_logging_test.log";
    {
        auto file_sink = std::make_shared<FileSink>(path, false);
        ASSERT_TRUE(file_sink->is_open());
        logger->add_sink(file_sink);

        // When: 出力して停止
        logger->log(LogLevel::INFO, "file", "written to file", __FILE__, __LINE__);
        logger->stop();
    }

    // Then: ファイルに1行書き込まれる
    std::ifstream input(path);
    std::string line;
    ASSERT_TRUE(std::getline(input, line));
    EXPECT_NE(line.find("[INFO] [file] written to file"), std::string::npos);
    input.close();
    std::remove(path.c_str());
}

// TEST 8: タイマー
TEST_F(LoggingTest, TimerMeasuresElapsedTime) {
    time_utils::Timer timer;
    EXPECT_FALSE(timer.is_running());

    timer.start();
    EXPECT_TRUE(timer.is_running());
    const double elapsed = timer.stop();

    EXPECT_FALSE(timer.is_running());
    EXPECT_GE(elapsed, 0.0);
    EXPECT_FALSE(time_utils::format_duration(elapsed).empty());
    EXPECT_FALSE(time_utils::get_timestamp_string().empty());
}

// メイン関数
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
