#ifndef MERIDIAN_LOGGER_H
#define MERIDIAN_LOGGER_H

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <queue>
#include <condition_variable>
#include <atomic>

namespace meridian {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

/**
 * @brief Process-wide asynchronous logger.
 *
 * Messages are queued by the caller and written by a worker thread, so
 * logging never blocks a retry session on disk or terminal I/O.
 */
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Selects the log destination.
     * @param path "stdout" (or empty) for the terminal, "/dev/null" to disable,
     *             any other value is opened in append mode.
     */
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }
    bool enabled(LogLevel level) const { return enabled_ && level >= level_; }

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
    void info(std::string_view message) { log(LogLevel::INFO, message); }
    void warn(std::string_view message) { log(LogLevel::WARN, message); }
    void log_error(const std::string& message);

    /**
     * @brief One line per transport invocation.
     */
    void log_attempt(std::string_view region,
                     std::string_view model_id,
                     int attempt,
                     std::string_view outcome,
                     long long elapsed_ms);

    /**
     * @brief Blocks until every queued message has been written.
     */
    void flush();

private:
    Logger();
    ~Logger();

    static std::string get_timestamp();
    void process_queue();
    void push(std::string msg);

    std::ofstream file_stream_;
    std::mutex sink_mutex_;
    bool use_stdout_{true};
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    bool writing_{false};
    std::thread worker_;
    bool running_{true};   // guarded by queue_mutex_
};

} // namespace meridian

#endif // MERIDIAN_LOGGER_H
