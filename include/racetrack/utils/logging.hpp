#ifndef RACETRACK_UTILS_LOGGING_HPP_
#define RACETRACK_UTILS_LOGGING_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace racetrack {
namespace logging {

/**
 * @brief ログレベル列挙型
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

/**
 * @brief 文字列からログレベルを取得（大文字小文字を区別しない）
 * @param name レベル名（debug, info, warn, error, fatal）
 * @return ログレベル（不明な名前はstd::nullopt）
 */
std::optional<LogLevel> parse_level(const std::string& name);

/**
 * @brief ログメッセージ構造体
 */
struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread_id;
};

/**
 * @brief ログ出力インターフェース
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogMessage& msg) = 0;
    virtual void flush() = 0;
};

/**
 * @brief コンソール出力用シンク
 */
class ConsoleSink : public LogSink {
public:
    ConsoleSink(bool colored = true);
    void write(const LogMessage& msg) override;
    void flush() override;

private:
    bool colored_;
    std::string get_color_code(LogLevel level) const;
};

/**
 * @brief ファイル出力用シンク
 */
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink();

    void write(const LogMessage& msg) override;
    void flush() override;

    bool is_open() const;

private:
    std::ofstream file_;
    std::mutex mutex_;
};

/**
 * @brief 非同期ログ出力クラス
 */
class AsyncLogger {
public:
    AsyncLogger();
    ~AsyncLogger();

    void add_sink(std::shared_ptr<LogSink> sink);
    void clear_sinks();
    void set_level(LogLevel level);
    LogLevel level() const;
    void set_flush_interval(int milliseconds);

    void log(LogLevel level, const std::string& category,
             const std::string& message, const std::string& file, int line);

    /**
     * @brief キュー内のメッセージを全て出力するまで待機
     */
    void flush();
    void stop();

private:
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex sinks_mutex_;
    std::queue<LogMessage> message_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::atomic<LogLevel> min_level_;
    int flush_interval_ms_;
    bool writing_;

    void worker_function();
    void write_to_sinks(const LogMessage& msg);
    void flush_sinks();
};

std::string get_level_string(LogLevel level);

std::string format_message(const LogMessage& msg);

/**
 * @brief グローバルロガーインスタンス
 */
class Logger {
public:
    static Logger& instance();

    void add_console_sink(bool colored = true);
    void add_file_sink(const std::string& filename, bool append = true);
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const;
    void set_flush_interval(int milliseconds);

    void log(LogLevel level, const std::string& category,
             const std::string& message, const std::string& file, int line);

    void flush();

private:
    Logger();
    ~Logger();

    std::unique_ptr<AsyncLogger> async_logger_;
    static std::once_flag initialized_;
};

// ログ出力マクロ
#define RACETRACK_LOG_DEBUG(category, message) \
    racetrack::logging::Logger::instance().log( \
        racetrack::logging::LogLevel::DEBUG, category, message, __FILE__, __LINE__)

#define RACETRACK_LOG_INFO(category, message) \
    racetrack::logging::Logger::instance().log( \
        racetrack::logging::LogLevel::INFO, category, message, __FILE__, __LINE__)

#define RACETRACK_LOG_WARN(category, message) \
    racetrack::logging::Logger::instance().log( \
        racetrack::logging::LogLevel::WARN, category, message, __FILE__, __LINE__)

#define RACETRACK_LOG_ERROR(category, message) \
    racetrack::logging::Logger::instance().log( \
        racetrack::logging::LogLevel::ERROR, category, message, __FILE__, __LINE__)

#define RACETRACK_LOG_FATAL(category, message) \
    racetrack::logging::Logger::instance().log( \
        racetrack::logging::LogLevel::FATAL, category, message, __FILE__, __LINE__)

// 文字列フォーマット用ヘルパー
template<typename... Args>
std::string format_string(const std::string& format, Args... args) {
    int size = std::snprintf(nullptr, 0, format.c_str(), args...) + 1;
    if (size <= 0) return "";

    std::unique_ptr<char[]> buf(new char[size]);
    std::snprintf(buf.get(), size, format.c_str(), args...);
    return std::string(buf.get(), buf.get() + size - 1);
}

} // namespace logging
} // namespace racetrack

#endif // RACETRACK_UTILS_LOGGING_HPP_
