#ifndef MIZU_LOGGER_H
#define MIZU_LOGGER_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace mizu {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

std::string_view to_string(LogLevel level);

/**
 * @brief Process-wide asynchronous logger for the router.
 *
 * Callers only queue records; a background worker formats them as
 * "[timestamp] LEVEL: text" and writes them to the configured sink. ERROR
 * records go to stderr when logging to the console. One ACCESS record is
 * written per handled request.
 */
class Logger {
private:
    enum class Sink { Console, File, Disabled };

    struct Record {
        std::string tag;   // "DEBUG".."ERROR" or "ACCESS"
        std::string text;
        bool error = false;
    };

    // Guards the queue and the worker state.
    std::mutex queue_mutex_;
    std::condition_variable pending_cv_;
    std::condition_variable drained_cv_;
    std::deque<Record> queue_;
    bool writing_ = false;
    bool stopping_ = false;

    // Guards the sink; held by configure() and by every write.
    std::mutex sink_mutex_;
    Sink sink_ = Sink::Console;
    std::ofstream file_;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> enabled_{true};
    std::thread worker_;

    Logger();

    void run();
    void write(const Record& record);
    void push(Record record);

public:
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& instance();

    // "stdout" or empty writes to the console, "/dev/null" disables output,
    // anything else is a file opened in append mode (parent directories are created).
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

    void log(LogLevel level, std::string_view message);
    void log_error(std::string_view message) { log(LogLevel::ERROR, message); }

    // "ACCESS: GET /users/42 200 3ms", written at INFO.
    void log_access(std::string_view method,
                    std::string_view path,
                    int status_code,
                    long long response_time_ms);

    /** @brief Blocks until every queued record has been written and the sink flushed. */
    void flush();
};

} // namespace mizu

#endif // MIZU_LOGGER_H
