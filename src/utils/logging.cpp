#include "racetrack/utils/logging.hpp"
#include "racetrack/utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace racetrack {
namespace logging {

std::once_flag Logger::initialized_;

std::optional<LogLevel> parse_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

std::string get_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

std::string format_message(const LogMessage& msg) {
    std::ostringstream oss;
    oss << "[" << msg.timestamp << "] "
        << "[" << get_level_string(msg.level) << "] "
        << "[" << msg.category << "] "
        << msg.message;

    // WARN以上は発生箇所を付加
    if (msg.level >= LogLevel::WARN && !msg.file.empty()) {
        const auto slash = msg.file.find_last_of("/\\");
        const std::string base = (slash == std::string::npos) ? msg.file : msg.file.substr(slash + 1);
        oss << " (" << base << ":" << msg.line << ")";
    }
    return oss.str();
}

// ConsoleSink
ConsoleSink::ConsoleSink(bool colored) : colored_(colored) {}

void ConsoleSink::write(const LogMessage& msg) {
    std::ostream& out = (msg.level >= LogLevel::WARN) ? std::cerr : std::clog;
    if (colored_) {
        out << get_color_code(msg.level) << format_message(msg) << "\033[0m" << '\n';
    } else {
        out << format_message(msg) << '\n';
    }
}

void ConsoleSink::flush() {
    std::clog.flush();
    std::cerr.flush();
}

std::string ConsoleSink::get_color_code(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";   // シアン
        case LogLevel::INFO:  return "\033[32m";   // 緑
        case LogLevel::WARN:  return "\033[33m";   // 黄
        case LogLevel::ERROR: return "\033[31m";   // 赤
        case LogLevel::FATAL: return "\033[35m";   // マゼンタ
    }
    return "\033[0m";
}

// FileSink
FileSink::FileSink(const std::string& filename, bool append)
    : file_(filename, append ? std::ios::app : std::ios::trunc) {}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << format_message(msg) << '\n';
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

bool FileSink::is_open() const {
    return file_.is_open();
}

// AsyncLogger
AsyncLogger::AsyncLogger()
    : running_(true), min_level_(LogLevel::INFO), flush_interval_ms_(100), writing_(false) {
    worker_thread_ = std::thread(&AsyncLogger::worker_function, this);
}

AsyncLogger::~AsyncLogger() {
    stop();
}

void AsyncLogger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void AsyncLogger::clear_sinks() {
    flush();
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

void AsyncLogger::set_level(LogLevel level) {
    min_level_ = level;
}

LogLevel AsyncLogger::level() const {
    return min_level_;
}

void AsyncLogger::set_flush_interval(int milliseconds) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    flush_interval_ms_ = std::max(1, milliseconds);
}

void AsyncLogger::log(LogLevel level, const std::string& category,
                      const std::string& message, const std::string& file, int line) {
    if (level < min_level_) {
        return;
    }

    LogMessage msg;
    msg.level = level;
    msg.timestamp = time_utils::get_timestamp_string();
    msg.category = category;
    msg.message = message;
    msg.file = file;
    msg.line = line;
    msg.thread_id = std::this_thread::get_id();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            // 停止後は同期出力
            write_to_sinks(msg);
            return;
        }
        message_queue_.push(std::move(msg));
    }
    queue_cv_.notify_one();
}

void AsyncLogger::flush() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (running_) {
            queue_cv_.notify_one();
            drained_cv_.wait(lock, [this] { return message_queue_.empty() && !writing_; });
        }
    }
    flush_sinks();
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    flush_sinks();
}

void AsyncLogger::worker_function() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait_for(lock, std::chrono::milliseconds(flush_interval_ms_),
                           [this] { return !message_queue_.empty() || !running_; });

        while (!message_queue_.empty()) {
            LogMessage msg = std::move(message_queue_.front());
            message_queue_.pop();
            writing_ = true;
            lock.unlock();
            write_to_sinks(msg);
            lock.lock();
            writing_ = false;
        }
        drained_cv_.notify_all();

        if (!running_) {
            break;
        }
    }
}

void AsyncLogger::write_to_sinks(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        sink->write(msg);
    }
}

void AsyncLogger::flush_sinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

// Logger
Logger& Logger::instance() {
    static Logger logger;
    std::call_once(initialized_, [] {
        logger.add_console_sink(true);
    });
    return logger;
}

Logger::Logger() : async_logger_(std::make_unique<AsyncLogger>()) {}

Logger::~Logger() {
    async_logger_->stop();
}

void Logger::add_console_sink(bool colored) {
    async_logger_->add_sink(std::make_shared<ConsoleSink>(colored));
}

void Logger::add_file_sink(const std::string& filename, bool append) {
    auto sink = std::make_shared<FileSink>(filename, append);
    if (!sink->is_open()) {
        throw std::runtime_error("Cannot open log file: " + filename);
    }
    async_logger_->add_sink(sink);
}

void Logger::clear_sinks() {
    async_logger_->clear_sinks();
}

void Logger::set_level(LogLevel level) {
    async_logger_->set_level(level);
}

LogLevel Logger::level() const {
    return async_logger_->level();
}

void Logger::set_flush_interval(int milliseconds) {
    async_logger_->set_flush_interval(milliseconds);
}

void Logger::log(LogLevel level, const std::string& category,
                 const std::string& message, const std::string& file, int line) {
    async_logger_->log(level, category, message, file, line);
}

void Logger::flush() {
    async_logger_->flush();
}

} // namespace logging
} // namespace racetrack
