#include "core/Logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace {

int levelRank(const std::string& level) {
    static const std::map<std::string, int> levels = {
        {"debug", 0}, {"info", 1}, {"warn", 2}, {"error", 3}
    };
    auto it = levels.find(level);
    return it != levels.end() ? it->second : 1;
}

} // namespace

Logger::Logger(const std::string& level, const std::string& log_file, bool timestamps)
    : log_level_(level), log_file_(log_file), log_timestamps_(timestamps) {
    if (!log_file_.empty()) {
        log_stream_.open(log_file_, std::ios::app);
        if (!log_stream_) {
            throw std::runtime_error("Could not open log file: " + log_file_);
        }
        sink_ = &log_stream_;
    }
}

Logger::Logger(std::ostream& sink, const std::string& level, bool timestamps)
    : log_level_(level), log_timestamps_(timestamps), sink_(&sink) {}

void Logger::log(const std::string& level, const std::string& msg) const {
    if (!shouldLog(level)) {
        return;
    }
    std::ostringstream oss;
    if (log_timestamps_) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        oss << "[" << std::put_time(&local, "%F %T") << "] ";
    }
    oss << "[" << level << "] " << msg << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    *sink_ << oss.str();
    sink_->flush();
}

bool Logger::shouldLog(const std::string& level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return levelRank(level) >= levelRank(log_level_);
}

void Logger::setLevel(const std::string& level) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_level_ = level;
}

std::string Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level_;
}
