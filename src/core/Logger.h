#pragma once
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

// Leveled line logger: "[%F %T] [level] message". Writes to an append-mode
// file when one is configured, stdout otherwise. Safe to share across threads.
class Logger {
public:
    // Throws std::runtime_error if log_file is set but cannot be opened
    explicit Logger(const std::string& level = "info", const std::string& log_file = "", bool timestamps = true);

    // Log into an arbitrary stream instead of stdout (tests, embedding)
    Logger(std::ostream& sink, const std::string& level, bool timestamps = true);

    void log(const std::string& level, const std::string& msg) const;
    void debug(const std::string& msg) const { log("debug", msg); }
    void info(const std::string& msg) const { log("info", msg); }
    void warn(const std::string& msg) const { log("warn", msg); }
    void error(const std::string& msg) const { log("error", msg); }

    bool shouldLog(const std::string& level) const;

    void setLevel(const std::string& level);
    std::string level() const;
    const std::string& file() const { return log_file_; }

private:
    std::string log_level_;
    std::string log_file_;
    bool log_timestamps_ = true;
    mutable std::ofstream log_stream_;
    std::ostream* sink_ = &std::cout;
    mutable std::mutex mutex_;
};
