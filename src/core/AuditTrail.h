#ifndef AUDIT_TRAIL_H
#define AUDIT_TRAIL_H

#include "core/SessionEvent.h"
#include <SQLiteCpp/SQLiteCpp.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Append-only record of session lifecycle events. Sessions themselves are
// never persisted; only what happened to them.
class AuditTrail {
public:
    // Throws SQLite::Exception if the database cannot be opened or written
    explicit AuditTrail(const std::string& db_path);
    ~AuditTrail();

    // Insert one event, retrying while the database is locked
    void record(const SessionEvent& event);

    // Newest first
    std::vector<SessionEvent> recent(size_t limit = 100);
    int64_t countByType(SessionEventType type);
    // Delete events older than retention_days; returns rows deleted
    int pruneOlderThan(int retention_days = 30);

    const std::string& path() const { return db_path_; }

private:
    std::unique_ptr<SQLite::Database> db_;
    std::string db_path_;
    std::mutex mutex_;
};

#endif // AUDIT_TRAIL_H
