#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

namespace selforg {
namespace logger {

enum class Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

struct LogConfig {
    std::string log_dir = "/tmp/.selforg_log";
    bool use_stdout = false;
    Level min_level = Level::INFO;
    size_t max_file_size = 4 * 1024 * 1024;  // 4MB
    size_t max_files = 3;
    bool async_mode = true;
    size_t flush_interval_ms = 500;

    // Overlays SELFORG_LOG_* environment variables on the defaults.
    // Defined in options.cpp next to the other environment readers.
    static LogConfig FromEnv();
};

/**
 * @brief Process-wide logger shared by every list instance.
 *
 * Entries are formatted on the calling thread and either written directly or
 * handed to a background writer that drains the queue in batches. File output
 * rotates by size; when the log directory cannot be prepared the logger turns
 * itself off and reports once on stderr.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void configure(const LogConfig& config) {
        bool was_async;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            was_async = config_.async_mode;
        }
        if (was_async) {
            stop_async_thread();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            config_ = config;
            min_level_.store(config.min_level);
            init();
        }
        if (config.async_mode) {
            start_async_thread();
        }
    }

    bool enabled(Level level) const {
        return init_success_.load() && level >= min_level_.load();
    }

    void log(Level level, const char* file, const char* func, int line, const char* fmt, ...) {
        if (!enabled(level)) return;

        char buffer[512];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        auto entry = format_log(level, file, func, line, buffer);

        if (async_running_.load()) {
            enqueue_log(std::move(entry));
        } else {
            write_log(entry);
        }
    }

    ~Logger() {
        stop_async_thread();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : config_(LogConfig::FromEnv()), stop_flag_(false) {
        min_level_.store(config_.min_level);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            init();
        }
        if (config_.async_mode) {
            start_async_thread();
        }
    }

    // Caller holds mutex_.
    void init() {
        namespace fs = std::filesystem;

        file_stream_.reset();
        if (config_.use_stdout) {
            init_success_.store(true);
            return;
        }

        std::error_code ec;
        if (!fs::exists(config_.log_dir, ec)) {
            fs::create_directories(config_.log_dir, ec);
        }
        if (ec) {
            init_success_.store(false);
            std::cerr << "selforg logger disabled: cannot prepare " << config_.log_dir
                      << ": " << ec.message() << std::endl;
            return;
        }

        current_log_path_ = get_log_path(0);
        open_log_file();
    }

    void open_log_file() {
        file_stream_ = std::make_unique<std::ofstream>(
            current_log_path_, std::ios::out | std::ios::app);
        init_success_.store(file_stream_->is_open());
    }

    // Caller holds mutex_.
    void rotate_log_files() {
        namespace fs = std::filesystem;

        file_stream_->close();
        std::error_code ec;
        for (size_t i = config_.max_files; i-- > 0;) {
            auto old_path = get_log_path(i);
            if (!fs::exists(old_path, ec)) continue;
            if (i + 1 >= config_.max_files) {
                fs::remove(old_path, ec);
            } else {
                fs::rename(old_path, get_log_path(i + 1), ec);
            }
        }
        open_log_file();
    }

    std::filesystem::path get_log_path(size_t index) const {
        namespace fs = std::filesystem;
        auto base_name = "selforg-" + std::to_string(getpid()) + ".log";
        if (index == 0) return fs::path(config_.log_dir) / base_name;
        return fs::path(config_.log_dir) / (base_name + "." + std::to_string(index));
    }

    static const char* level_name(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARNING";
            case Level::ERROR: return "ERROR";
        }
        return "UNKNOWN";
    }

    std::string format_log(Level level, const char* file, const char* func, int line,
                           const char* message) const {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf;
        localtime_r(&t, &tm_buf);
        char time_str[20];
        std::strftime(time_str, sizeof(time_str), "%Y%m%d%H%M%S", &tm_buf);

        std::filesystem::path source(file);

        std::ostringstream oss;
        oss << "[" << time_str << "] "
            << "[" << level_name(level) << "] "
            << "[" << getpid() << ":" << std::this_thread::get_id() << "] "
            << "[" << source.filename().string() << ":" << func << ":" << line << "] "
            << message << "\n";
        return oss.str();
    }

    void write_log(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (config_.use_stdout) {
            std::cout << entry;
            return;
        }

        if (file_stream_ && file_stream_->is_open()) {
            *file_stream_ << entry;
            file_stream_->flush();

            std::error_code ec;
            auto size = std::filesystem::file_size(current_log_path_, ec);
            if (!ec && size >= config_.max_file_size) {
                rotate_log_files();
            }
        }
    }

    void enqueue_log(std::string entry) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(std::move(entry));
        }
        queue_cv_.notify_one();
    }

    void start_async_thread() {
        stop_flag_ = false;
        async_thread_ = std::thread([this] { async_logging_thread(); });
        async_running_.store(true);
    }

    void stop_async_thread() {
        async_running_.store(false);
        stop_flag_ = true;
        queue_cv_.notify_one();
        if (async_thread_.joinable()) {
            async_thread_.join();
        }
    }

    void drain_queue(std::vector<std::string>& batch) {
        while (!log_queue_.empty()) {
            batch.push_back(std::move(log_queue_.front()));
            log_queue_.pop();
        }
    }

    void async_logging_thread() {
        for (;;) {
            std::vector<std::string> batch;
            bool stopping;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait_for(lock,
                    std::chrono::milliseconds(config_.flush_interval_ms),
                    [this] { return !log_queue_.empty() || stop_flag_; });
                drain_queue(batch);
                stopping = stop_flag_;
            }

            for (const auto& entry : batch) {
                write_log(entry);
            }
            // Entries queued before the stop request are flushed above.
            if (stopping) break;
        }
    }

    LogConfig config_;
    std::atomic<Level> min_level_{Level::INFO};
    std::unique_ptr<std::ofstream> file_stream_;
    std::atomic<bool> init_success_{false};
    std::mutex mutex_;
    std::filesystem::path current_log_path_;

    std::queue<std::string> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread async_thread_;
    std::atomic<bool> async_running_{false};
    std::atomic<bool> stop_flag_;
};

} // namespace logger
} // namespace selforg

#define SELFORG_LOG_DEBUG(fmt, ...) \
    ::selforg::logger::Logger::instance().log(::selforg::logger::Level::DEBUG, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define SELFORG_LOG_INFO(fmt, ...) \
    ::selforg::logger::Logger::instance().log(::selforg::logger::Level::INFO, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define SELFORG_LOG_WARNING(fmt, ...) \
    ::selforg::logger::Logger::instance().log(::selforg::logger::Level::WARNING, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define SELFORG_LOG_ERROR(fmt, ...) \
    ::selforg::logger::Logger::instance().log(::selforg::logger::Level::ERROR, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)
