#pragma once
#include "core/AuditTrail.h"
#include "core/Logger.h"
#include "core/SessionManager.h"
#include "daemon/CommandShell.h"
#include "daemon/DaemonConfig.h"
#include "daemon/SessionJanitor.h"
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <yaml-cpp/yaml.h>

class SessionDaemon {
public:
    // File-based constructor (production use)
    explicit SessionDaemon(const std::string& config_path);
    // In-memory constructor (testing use)
    SessionDaemon(const YAML::Node& config, const std::string& config_name);
    ~SessionDaemon();

    SessionDaemon(const SessionDaemon&) = delete;
    SessionDaemon& operator=(const SessionDaemon&) = delete;

    // Serves shell commands from `in` until EOF, quit, stop() or a signal
    void run(std::istream& in = std::cin, std::ostream& out = std::cout);
    void stop();
    bool isRunning() const { return running_.load(); }
    static void signalHandler(int signum);

    const DaemonConfig& config() const { return config_; }
    std::shared_ptr<SessionManager> manager() const { return manager_; }
    std::shared_ptr<Logger> logger() const { return logger_; }
    // Null when audit.database is not configured
    std::shared_ptr<AuditTrail> auditTrail() const { return audit_; }
    // Null when session.janitor is false
    SessionJanitor* janitor() const { return janitor_.get(); }

private:
    void initializeFromConfig(const DaemonConfig& config);

    std::string config_path_;
    std::string config_name_;
    DaemonConfig config_;

    std::atomic<bool> running_{false};
    static std::atomic<bool> running_signal_;

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<AuditTrail> audit_;
    std::shared_ptr<SessionManager> manager_;
    std::unique_ptr<SessionJanitor> janitor_;
};
