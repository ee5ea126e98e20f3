#include <mizu/logger.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mizu {

namespace {
    std::string timestamp() {
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }
}

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : worker_(&Logger::run, this) {}

Logger::~Logger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    pending_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    for (;;) {
        pending_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            break;  // Stopping with nothing left to write
        }

        Record record = std::move(queue_.front());
        queue_.pop_front();
        writing_ = true;

        lock.unlock();
        write(record);
        lock.lock();

        writing_ = false;
        if (queue_.empty()) {
            drained_cv_.notify_all();
        }
    }
}

void Logger::write(const Record& record) {
    const std::string line = "[" + timestamp() + "] " + record.tag + ": " + record.text + "\n";

    std::lock_guard<std::mutex> lock(sink_mutex_);
    switch (sink_) {
        case Sink::Console:
            (record.error ? std::cerr : std::cout) << line;
            break;
        case Sink::File:
            file_ << line;
            if (record.error) {
                file_.flush();
            }
            break;
        case Sink::Disabled:
            break;
    }
}

void Logger::push(Record record) {
    if (!enabled_) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(record));
    }
    pending_cv_.notify_one();
}

void Logger::configure(const std::string& path) {
    std::lock_guard<std::mutex> lock(sink_mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    if (path == "/dev/null") {
        sink_ = Sink::Disabled;
        enabled_ = false;
        return;
    }

    enabled_ = true;
    if (path == "stdout" || path.empty()) {
        sink_ = Sink::Console;
        return;
    }

    const std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        sink_ = Sink::Console;
        std::cerr << "[" << timestamp() << "] ERROR: cannot open log file " << path
                  << ", logging to the console\n";
        return;
    }
    sink_ = Sink::File;
}

void Logger::log(LogLevel level, std::string_view message) {
    if (level < level_) return;
    push(Record{std::string(to_string(level)), std::string(message), level == LogLevel::ERROR});
}

void Logger::log_access(std::string_view method,
                        std::string_view path,
                        int status_code,
                        long long response_time_ms) {
    if (LogLevel::INFO < level_) return;

    std::ostringstream text;
    text << method << " " << path << " " << status_code << " " << response_time_ms << "ms";
    push(Record{"ACCESS", text.str(), false});
}

void Logger::flush() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        drained_cv_.wait(lock, [this] { return queue_.empty() && !writing_; });
    }

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_ == Sink::File) {
        file_.flush();
    } else if (sink_ == Sink::Console) {
        std::cout.flush();
    }
}

} // namespace mizu
