#include "daemon/SessionJanitor.h"
#include <stdexcept>
#include <string>
#include <utility>

SessionJanitor::SessionJanitor(std::shared_ptr<SessionManager> manager,
                               std::chrono::milliseconds interval,
                               std::shared_ptr<Logger> logger)
    : manager_(std::move(manager)), interval_(interval), logger_(std::move(logger)) {
    if (!manager_) {
        throw std::invalid_argument("SessionJanitor requires a session manager");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("SessionJanitor interval must be positive");
    }
}

SessionJanitor::~SessionJanitor() {
    stop();
}

void SessionJanitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    if (logger_) {
        logger_->info("Session janitor started (interval: " + std::to_string(interval_.count()) + "ms)");
    }
    worker_ = std::thread([this]() { loop(); });
}

void SessionJanitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false) && !worker_.joinable()) {
            return;
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (logger_) {
        logger_->info("Session janitor stopped after " + std::to_string(passes_.load()) + " pass(es)");
    }
}

void SessionJanitor::runOnce() {
    auto removed = manager_->cleanupExpired();
    passes_++;
    if (!removed.ok()) {
        // Keep running: the operator decides when to reset a poisoned store
        failures_++;
        if (logger_) {
            logger_->error("Janitor cleanup failed: " + removed.error().message());
        }
        return;
    }
    removed_total_ += removed.value();
    if (logger_ && removed.value() > 0) {
        logger_->debug("Janitor reclaimed " + std::to_string(removed.value()) + " session(s)");
    }
}

void SessionJanitor::loop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load()) {
        if (wake_.wait_for(lock, interval_, [this]() { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        runOnce();
        lock.lock();
    }
}
