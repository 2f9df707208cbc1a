#include "daemon/DaemonConfig.h"
#include <chrono>
#include <stdexcept>
#include <string>

namespace {

// Accepts "<key>_ms" or "<key>_seconds"; milliseconds win when both are given
void readDuration(const YAML::Node& section, const std::string& key, std::chrono::milliseconds& out) {
    if (section[key + "_ms"]) {
        out = std::chrono::milliseconds(section[key + "_ms"].as<int64_t>());
    } else if (section[key + "_seconds"]) {
        int64_t seconds = section[key + "_seconds"].as<int64_t>();
        // Checked before scaling so the conversion cannot overflow
        const int64_t limit = SessionConfig::maxDuration().count() / 1000;
        if (seconds > limit || seconds < -limit) {
            throw std::runtime_error("session." + key + "_seconds out of range: " + std::to_string(seconds));
        }
        out = std::chrono::seconds(seconds);
    }
}

} // namespace

DaemonConfig DaemonConfig::fromYaml(const YAML::Node& config) {
    DaemonConfig out;

    try {
        // 1. Logging
        if (config["logging"]) {
            const YAML::Node logging = config["logging"];
            out.logging.level = logging["level"] ? logging["level"].as<std::string>() : "info";
            out.logging.file = logging["file"] ? logging["file"].as<std::string>() : "";
            out.logging.timestamps = logging["timestamps"] ? logging["timestamps"].as<bool>() : true;
        }
        if (out.logging.level != "debug" && out.logging.level != "info" &&
            out.logging.level != "warn" && out.logging.level != "error") {
            throw std::runtime_error("Invalid logging.level: " + out.logging.level);
        }

        // 2. Session store (all keys optional)
        if (config["session"]) {
            const YAML::Node session = config["session"];
            readDuration(session, "timeout", out.session.timeout);
            readDuration(session, "cleanup_interval", out.session.cleanup_interval);
            if (session["max_sessions"]) {
                int64_t max_sessions = session["max_sessions"].as<int64_t>();
                if (max_sessions < 1) {
                    throw std::runtime_error("session.max_sessions must be at least 1");
                }
                out.session.max_sessions = static_cast<size_t>(max_sessions);
            }
            if (session["max_sessions_per_owner"]) {
                int64_t per_owner = session["max_sessions_per_owner"].as<int64_t>();
                if (per_owner < 0) {
                    throw std::runtime_error("session.max_sessions_per_owner must not be negative (0 = unlimited)");
                }
                out.session.max_sessions_per_owner = static_cast<size_t>(per_owner);
            }
            if (session["token_prefix"]) {
                out.session.token_prefix = session["token_prefix"].as<std::string>();
            }
            if (session["eviction"]) {
                std::string name = session["eviction"].as<std::string>();
                auto policy = evictionPolicyFromString(name);
                if (!policy) {
                    throw std::runtime_error("Invalid session.eviction: " + name +
                                             " (expected oldest_created or least_recent_activity)");
                }
                out.session.eviction = *policy;
            }
            if (session["janitor"]) {
                out.janitor_enabled = session["janitor"].as<bool>();
            }
        }

        // 3. Audit trail
        if (config["audit"]) {
            const YAML::Node audit = config["audit"];
            if (audit["database"]) {
                out.audit_db = audit["database"].as<std::string>();
            }
            if (audit["retention_days"]) {
                out.audit_retention_days = audit["retention_days"].as<int>();
                if (out.audit_retention_days < 1) {
                    throw std::runtime_error("audit.retention_days must be at least 1");
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value: " + std::string(e.what()));
    }

    try {
        out.session.validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid session config: " + std::string(e.what()));
    }
    return out;
}

DaemonConfig DaemonConfig::fromFile(const std::string& path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file: " + std::string(e.what()));
    }
    return fromYaml(config);
}
