#pragma once
#include "core/SessionConfig.h"
#include <string>
#include <yaml-cpp/yaml.h>

struct LoggingConfig {
    std::string level = "info";
    std::string file;           // empty = stdout
    bool timestamps = true;
};

struct DaemonConfig {
    LoggingConfig logging;
    SessionConfig session;
    std::string audit_db;       // empty = audit trail disabled
    int audit_retention_days = 30;
    bool janitor_enabled = true;

    // Throws std::runtime_error on missing/invalid values
    static DaemonConfig fromYaml(const YAML::Node& config);
    // Throws std::runtime_error if the file cannot be read or parsed
    static DaemonConfig fromFile(const std::string& path);
};
