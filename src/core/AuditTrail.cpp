#include "core/AuditTrail.h"
#include <SQLiteCpp/SQLiteCpp.h>
#include <sqlite3.h>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

int64_t toMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

// Constructor
AuditTrail::AuditTrail(const std::string& db_path) : db_path_(db_path) {
    db_ = std::make_unique<SQLite::Database>(db_path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);

    // WAL lets the janitor and request threads append without blocking readers
    db_->exec("PRAGMA journal_mode=WAL;");
    db_->exec("PRAGMA busy_timeout=5000;");

    // Fail early on read-only databases
    try {
        db_->exec("CREATE TABLE IF NOT EXISTS _write_test (id INTEGER);");
        db_->exec("DROP TABLE _write_test;");
    } catch (const SQLite::Exception& e) {
        throw SQLite::Exception("Audit database is read-only or cannot be written to: " + std::string(e.what()));
    }

    db_->exec(R"(
        CREATE TABLE IF NOT EXISTS session_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            event TEXT NOT NULL,
            session_id TEXT NOT NULL,
            owner TEXT,
            occurred_at INTEGER NOT NULL,
            detail TEXT NOT NULL
        )
    )");

    db_->exec("CREATE INDEX IF NOT EXISTS idx_events_occurred_at ON session_events(occurred_at);");
    db_->exec("CREATE INDEX IF NOT EXISTS idx_events_session ON session_events(session_id);");
}

AuditTrail::~AuditTrail() {
    // SQLiteCpp unique_ptr handles cleanup automatically
}

void AuditTrail::record(const SessionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    const int MAX_RETRIES = 5;
    for (int attempt = 0; attempt < MAX_RETRIES; ++attempt) {
        try {
            SQLite::Statement insert(*db_,
                "INSERT INTO session_events (event, session_id, owner, occurred_at, detail) "
                "VALUES (?, ?, ?, ?, ?)");

            insert.bind(1, toString(event.type));
            insert.bind(2, event.session_id);
            if (event.owner) {
                insert.bind(3, *event.owner);
            } else {
                insert.bind(3);
            }
            insert.bind(4, toMillis(event.timestamp));
            insert.bind(5, event.detail);

            insert.exec();
            return;

        } catch (const SQLite::Exception& e) {
            if (e.getErrorCode() == SQLITE_BUSY || e.getErrorCode() == SQLITE_LOCKED) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50 * (attempt + 1)));
                continue;
            }
            throw;
        }
    }

    throw std::runtime_error("Failed to record audit event after " + std::to_string(MAX_RETRIES) +
                             " attempts (database locked)");
}

std::vector<SessionEvent> AuditTrail::recent(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    SQLite::Statement query(*db_,
        "SELECT event, session_id, owner, occurred_at, detail FROM session_events "
        "ORDER BY occurred_at DESC, id DESC LIMIT ?");
    query.bind(1, static_cast<int64_t>(limit));

    std::vector<SessionEvent> events;
    while (query.executeStep()) {
        auto type = eventTypeFromString(query.getColumn(0).getText());
        if (!type) {
            // Written by a newer build; skip rather than guess
            continue;
        }
        SessionEvent event{*type, query.getColumn(1).getText()};
        if (!query.getColumn(2).isNull()) {
            event.owner = query.getColumn(2).getText();
        }
        event.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(query.getColumn(3).getInt64()));
        event.detail = query.getColumn(4).getText();
        events.push_back(std::move(event));
    }
    return events;
}

int64_t AuditTrail::countByType(SessionEventType type) {
    std::lock_guard<std::mutex> lock(mutex_);

    SQLite::Statement query(*db_, "SELECT COUNT(*) FROM session_events WHERE event = ?");
    query.bind(1, toString(type));
    query.executeStep();
    return query.getColumn(0).getInt64();
}

int AuditTrail::pruneOlderThan(int retention_days) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);
    SQLite::Statement del(*db_, "DELETE FROM session_events WHERE occurred_at < ?");
    del.bind(1, toMillis(cutoff));
    return del.exec();
}
