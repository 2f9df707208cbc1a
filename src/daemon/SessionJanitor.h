#pragma once
#include "core/Logger.h"
#include "core/SessionManager.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

// Periodic caller of SessionManager::cleanupExpired. Lives outside the store
// so the store itself never owns a thread.
class SessionJanitor {
public:
    SessionJanitor(std::shared_ptr<SessionManager> manager,
                   std::chrono::milliseconds interval,
                   std::shared_ptr<Logger> logger = nullptr);
    ~SessionJanitor();

    SessionJanitor(const SessionJanitor&) = delete;
    SessionJanitor& operator=(const SessionJanitor&) = delete;

    void start();
    // Wakes the worker and joins it; safe to call more than once
    void stop();
    bool isRunning() const { return running_.load(); }

    // One cleanup pass on the caller's thread
    void runOnce();

    uint64_t passes() const { return passes_.load(); }
    uint64_t removedTotal() const { return removed_total_.load(); }
    uint64_t failures() const { return failures_.load(); }

private:
    void loop();

    std::shared_ptr<SessionManager> manager_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<Logger> logger_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    std::atomic<uint64_t> passes_{0};
    std::atomic<uint64_t> removed_total_{0};
    std::atomic<uint64_t> failures_{0};
};
