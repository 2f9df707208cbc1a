#include "daemon/SessionDaemon.h"
#include <csignal>
#include <iostream>
#include <stdexcept>

// ===================================================================
// CONSTRUCTORS
// ===================================================================

SessionDaemon::SessionDaemon(const std::string& config_path)
    : config_path_(config_path), config_(DaemonConfig::fromFile(config_path)) {
    initializeFromConfig(config_);
    logger_->info("Loaded configuration from: " + config_path_);
}

SessionDaemon::SessionDaemon(const YAML::Node& config, const std::string& config_name)
    : config_name_(config_name), config_(DaemonConfig::fromYaml(config)) {
    initializeFromConfig(config_);
    logger_->info("Loaded configuration from memory: " + config_name_);
}

// ===================================================================
// COMMON INITIALIZATION (used by both constructors)
// ===================================================================

void SessionDaemon::initializeFromConfig(const DaemonConfig& config) {
    /*
     * Initialization Order (do not reorder):
     * 1. Logging
     * 2. Audit trail (optional)
     * 3. Session manager, with the audit trail subscribed to its events
     * 4. Janitor (optional)
     */

    // 1. Logging
    logger_ = std::make_shared<Logger>(config.logging.level, config.logging.file, config.logging.timestamps);

    // 2. Audit trail
    if (!config.audit_db.empty()) {
        audit_ = std::make_shared<AuditTrail>(config.audit_db);
        int pruned = audit_->pruneOlderThan(config.audit_retention_days);
        logger_->info("Audit trail opened: " + config.audit_db + " (pruned " + std::to_string(pruned) +
                      " event(s) older than " + std::to_string(config.audit_retention_days) + " days)");
    } else {
        logger_->warn("Audit trail disabled - no audit.database in config");
    }

    // 3. Session manager
    manager_ = std::make_shared<SessionManager>(config.session, logger_);
    if (audit_) {
        std::shared_ptr<AuditTrail> audit = audit_;
        std::shared_ptr<Logger> logger = logger_;
        manager_->onEvent([audit, logger](const SessionEvent& event) {
            try {
                audit->record(event);
            } catch (const std::exception& e) {
                logger->error("Audit write failed for " + std::string(toString(event.type)) + ": " + e.what());
            }
        });
    }

    // 4. Janitor
    if (config.janitor_enabled) {
        janitor_ = std::make_unique<SessionJanitor>(manager_, config.session.cleanup_interval, logger_);
    }

    logger_->info("SessionDaemon initialized successfully");
}

// ===================================================================
// DESTRUCTOR
// ===================================================================

SessionDaemon::~SessionDaemon() {
    stop();
    if (janitor_) {
        janitor_->stop();
    }
}

// ===================================================================
// RUN METHOD
// ===================================================================

void SessionDaemon::run(std::istream& in, std::ostream& out) {
    running_.store(true);
    logger_->info("SessionDaemon is running...");

    if (janitor_) {
        janitor_->start();
    }

    CommandShell shell(manager_, logger_);
    size_t executed = shell.run(in, out, [this]() {
        return running_.load() && running_signal_.load();
    });

    logger_->info("Daemon shutting down after " + std::to_string(executed) + " command(s)...");
    if (janitor_) {
        janitor_->stop();
    }
    running_.store(false);
}

void SessionDaemon::stop() {
    if (!running_.load()) return;

    logger_->info("SessionDaemon is stopping...");
    running_.store(false);
}

// ===================================================================
// SIGNAL HANDLING
// ===================================================================

std::atomic<bool> SessionDaemon::running_signal_{true};

void SessionDaemon::signalHandler(int signum) {
    std::cout << "\n[INFO] Signal (" << signum << ") received. Shutting down..." << std::endl;
    running_signal_ = false;
}
