#include "core/SessionManager.h"
#include <exception>
#include <utility>

namespace {

const SessionConfig& validated(const SessionConfig& config) {
    config.validate();
    return config;
}

const char* levelFor(SessionEventType type) {
    switch (type) {
        case SessionEventType::Refreshed:
        case SessionEventType::Updated:
            return "debug";
        case SessionEventType::Evicted:
        case SessionEventType::Reset:
            return "warn";
        case SessionEventType::Poisoned:
            return "error";
        default:
            return "info";
    }
}

SessionEvent eventFor(SessionEventType type, const SessionRecord& record, std::string detail = "") {
    return SessionEvent{type, record.id.str(), record.owner, std::chrono::system_clock::now(), std::move(detail)};
}

std::string millisText(std::chrono::milliseconds ms) {
    return std::to_string(ms.count()) + "ms";
}

} // namespace

// Constructor
SessionManager::SessionManager(const SessionConfig& config, std::shared_ptr<Logger> logger)
    : config_(validated(config)),
      generator_(config_.token_prefix),
      logger_(std::move(logger)),
      last_cleanup_(std::chrono::steady_clock::now()) {
    if (logger_) {
        logger_->info("Session manager initialized (timeout: " + millisText(config_.timeout) +
                      ", max_sessions: " + std::to_string(config_.max_sessions) +
                      ", eviction: " + toString(config_.eviction) + ")");
    }
}

SessionManager::~SessionManager() = default;

// ===================================================================
// INSERTION
// ===================================================================

SessionResult<SessionRecord> SessionManager::create(const std::optional<std::string>& owner) {
    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        SessionRecord record = SessionRecord::create(generator_.generate(), owner);
        auto inserted = insert(record, false, SessionEventType::Created);
        if (inserted.ok()) {
            return record;
        }
        if (inserted.is(SessionErrorKind::LimitExceeded) && logger_) {
            logger_->warn(inserted.error().message());
        }
        if (!inserted.is(SessionErrorKind::AlreadyExists)) {
            return inserted.error();
        }
        // 128-bit collision: practically unreachable, but never overwrite a live session
        if (logger_) {
            logger_->warn("Generated session id collided, retrying (attempt " + std::to_string(attempt + 1) + ")");
        }
    }
    return SessionError::alreadyExists("generated id");
}

SessionResult<void> SessionManager::store(const SessionRecord& record) {
    if (!record.timestampsConsistent()) {
        return SessionError::invalidRecord(record.id.str(), "last_activity precedes created_at");
    }
    return insert(record, true, SessionEventType::Stored);
}

SessionResult<void> SessionManager::insert(const SessionRecord& record, bool overwrite, SessionEventType event_type) {
    std::vector<SessionEvent> events;
    auto result = exclusive([&](SessionMap& sessions) -> SessionResult<void> {
        auto existing = sessions.find(record.id);
        if (existing != sessions.end()) {
            if (!overwrite) {
                return SessionError::alreadyExists(record.id.str());
            }
            existing->second = record;
            events.push_back(eventFor(event_type, record, "overwrite"));
            return SessionResult<void>::success();
        }

        // Per-owner cap applies to minted sessions only, counted before eviction
        if (!overwrite && record.owner && config_.max_sessions_per_owner > 0) {
            auto now = std::chrono::steady_clock::now();
            size_t owned = 0;
            for (const auto& kv : sessions) {
                if (kv.second.owner == record.owner && !kv.second.isExpired(now, config_.timeout)) {
                    ++owned;
                }
            }
            if (owned >= config_.max_sessions_per_owner) {
                return SessionError::limitExceeded(*record.owner, config_.max_sessions_per_owner);
            }
        }

        // New key: make room first so the bound holds at every instant
        if (sessions.size() >= config_.max_sessions) {
            evictOne(sessions, events);
        }
        sessions.emplace(record.id, record);
        events.push_back(eventFor(event_type, record));
        return SessionResult<void>::success();
    });

    emit(events);
    return result;
}

void SessionManager::evictOne(SessionMap& sessions, std::vector<SessionEvent>& events) const {
    if (sessions.empty()) {
        return;
    }
    auto victim = sessions.begin();
    for (auto it = sessions.begin(); it != sessions.end(); ++it) {
        const SessionRecord& candidate = it->second;
        const SessionRecord& current = victim->second;
        bool older = config_.eviction == EvictionPolicy::OldestCreated
            ? candidate.created_at.monotonic < current.created_at.monotonic
            : candidate.last_activity.monotonic < current.last_activity.monotonic;
        if (older) {
            victim = it;
        }
    }
    events.push_back(eventFor(SessionEventType::Evicted, victim->second,
                              "capacity=" + std::to_string(config_.max_sessions) +
                              " policy=" + toString(config_.eviction)));
    sessions.erase(victim);
}

// ===================================================================
// LOOKUP AND REFRESH
// ===================================================================

SessionResult<SessionRecord> SessionManager::get(const SessionId& id) const {
    return store_.withShared([&](const SessionMap& sessions) -> SessionResult<SessionRecord> {
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return SessionError::notFound(id.str());
        }
        if (it->second.isExpired(std::chrono::steady_clock::now(), config_.timeout)) {
            return SessionError::expired(id.str());
        }
        return it->second;
    });
}

SessionResult<void> SessionManager::refresh(const SessionId& id) {
    auto result = getAndRefresh(id);
    if (!result.ok()) {
        return result.error();
    }
    return SessionResult<void>::success();
}

SessionResult<SessionRecord> SessionManager::getAndRefresh(const SessionId& id) {
    std::vector<SessionEvent> events;
    auto result = exclusive([&](SessionMap& sessions) -> SessionResult<SessionRecord> {
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return SessionError::notFound(id.str());
        }
        SessionRecord& record = it->second;
        Instant now = Instant::now();
        if (record.isExpired(now.monotonic, config_.timeout)) {
            events.push_back(eventFor(SessionEventType::Expired, record,
                                      "idle=" + millisText(record.idleFor(now.monotonic))));
            return SessionError::expired(id.str());
        }
        record.touch(now);
        events.push_back(eventFor(SessionEventType::Refreshed, record,
                                  "remaining=" + millisText(config_.timeout)));
        return record;
    });

    emit(events);
    return result;
}

// ===================================================================
// REMOVAL AND CLEANUP
// ===================================================================

SessionResult<std::optional<SessionRecord>> SessionManager::remove(const SessionId& id) {
    std::vector<SessionEvent> events;
    auto result = exclusive([&](SessionMap& sessions) -> SessionResult<std::optional<SessionRecord>> {
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return std::optional<SessionRecord>();
        }
        std::optional<SessionRecord> removed(std::move(it->second));
        sessions.erase(it);
        events.push_back(eventFor(SessionEventType::Removed, *removed,
                                  "age=" + millisText(removed->age(std::chrono::steady_clock::now()))));
        return removed;
    });

    emit(events);
    return result;
}

SessionResult<size_t> SessionManager::removeAllForOwner(const std::string& owner) {
    std::vector<SessionEvent> events;

    auto result = exclusive([&](SessionMap& sessions) -> SessionResult<size_t> {
        auto now = std::chrono::steady_clock::now();
        size_t removed = 0;
        for (auto it = sessions.begin(); it != sessions.end();) {
            if (it->second.owner && *it->second.owner == owner) {
                events.push_back(eventFor(SessionEventType::Removed, it->second,
                                          "revoked age=" + millisText(it->second.age(now))));
                it = sessions.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    });

    if (result.ok() && logger_ && result.value() > 0) {
        logger_->info("Revoked " + std::to_string(result.value()) + " session(s) for owner: " + owner);
    }
    emit(events);
    return result;
}

SessionResult<size_t> SessionManager::cleanupExpired() {
    std::vector<SessionEvent> events;
    auto result = exclusive([&](SessionMap& sessions) -> SessionResult<size_t> {
        auto now = std::chrono::steady_clock::now();
        size_t removed = 0;
        for (auto it = sessions.begin(); it != sessions.end();) {
            if (it->second.isExpired(now, config_.timeout)) {
                events.push_back(eventFor(SessionEventType::CleanedUp, it->second,
                                          "idle=" + millisText(it->second.idleFor(now))));
                it = sessions.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    });

    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        last_cleanup_ = std::chrono::steady_clock::now();
    }

    if (result.ok() && logger_ && result.value() > 0) {
        logger_->info("Cleanup removed " + std::to_string(result.value()) + " expired session(s)");
    }
    emit(events);
    return result;
}

SessionResult<std::optional<size_t>> SessionManager::maybeCleanup() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        if (std::chrono::steady_clock::now() - last_cleanup_ < config_.cleanup_interval) {
            return std::optional<size_t>();
        }
    }
    auto removed = cleanupExpired();
    if (!removed.ok()) {
        return removed.error();
    }
    return std::optional<size_t>(removed.value());
}

// ===================================================================
// COUNTS AND INTROSPECTION
// ===================================================================

SessionResult<size_t> SessionManager::activeCount() const {
    return store_.withShared([&](const SessionMap& sessions) -> SessionResult<size_t> {
        auto now = std::chrono::steady_clock::now();
        size_t active = 0;
        for (const auto& kv : sessions) {
            if (!kv.second.isExpired(now, config_.timeout)) {
                ++active;
            }
        }
        return active;
    });
}

SessionResult<size_t> SessionManager::size() const {
    return store_.withShared([](const SessionMap& sessions) -> SessionResult<size_t> {
        return sessions.size();
    });
}

SessionResult<std::vector<SessionRecord>> SessionManager::sessionsForOwner(const std::string& owner) const {
    return store_.withShared([&](const SessionMap& sessions) -> SessionResult<std::vector<SessionRecord>> {
        auto now = std::chrono::steady_clock::now();
        std::vector<SessionRecord> matches;
        for (const auto& kv : sessions) {
            const SessionRecord& record = kv.second;
            if (record.owner && *record.owner == owner && !record.isExpired(now, config_.timeout)) {
                matches.push_back(record);
            }
        }
        return matches;
    });
}

SessionResult<SessionStats> SessionManager::stats() const {
    return store_.withShared([&](const SessionMap& sessions) -> SessionResult<SessionStats> {
        auto now = std::chrono::steady_clock::now();
        SessionStats out;
        out.total = sessions.size();
        for (const auto& kv : sessions) {
            if (kv.second.isExpired(now, config_.timeout)) {
                ++out.expired;
            } else {
                ++out.active;
                if (kv.second.authenticated) {
                    ++out.authenticated;
                }
            }
        }
        return out;
    });
}

// ===================================================================
// METADATA / AUTHENTICATION
// ===================================================================

SessionResult<SessionRecord> SessionManager::update(const SessionId& id, const Mutator& mutator) {
    auto current = get(id);
    if (!current.ok()) {
        return current.error();
    }
    const SessionRecord& before = current.value();
    SessionRecord edited = before;
    mutator(edited);

    // Only the keys the mutator changed are written back
    SessionEdit edit;
    for (const auto& kv : edited.metadata) {
        auto old = before.metadata.find(kv.first);
        if (old == before.metadata.end() || old->second != kv.second) {
            edit.metadata[kv.first] = kv.second;
        }
    }
    for (const auto& kv : before.metadata) {
        if (edited.metadata.find(kv.first) == edited.metadata.end()) {
            edit.metadata[kv.first] = std::nullopt;
        }
    }
    if (edited.authenticated != before.authenticated) {
        edit.authenticated = edited.authenticated;
    }
    return applyEdit(id, edit);
}

SessionResult<SessionRecord> SessionManager::applyEdit(const SessionId& id, const SessionEdit& edit) {
    std::vector<SessionEvent> events;

    auto result = exclusive([&](SessionMap& sessions) -> SessionResult<SessionRecord> {
        auto it = sessions.find(id);
        if (it == sessions.end()) {
            return SessionError::notFound(id.str());
        }
        SessionRecord& record = it->second;
        if (record.isExpired(std::chrono::steady_clock::now(), config_.timeout)) {
            return SessionError::expired(id.str());
        }

        for (const auto& change : edit.metadata) {
            if (change.second) {
                record.metadata[change.first] = *change.second;
            } else {
                record.metadata.erase(change.first);
            }
        }
        if (edit.authenticated) {
            record.authenticated = *edit.authenticated;
        }

        events.push_back(eventFor(SessionEventType::Updated, record,
                                  "metadata_keys=" + std::to_string(record.metadata.size()) +
                                  " authenticated=" + (record.authenticated ? "true" : "false")));
        return record;
    });

    emit(events);
    return result;
}

SessionResult<void> SessionManager::setMetadata(const SessionId& id, const std::string& key, const std::string& value) {
    SessionEdit edit;
    edit.metadata[key] = value;
    auto result = applyEdit(id, edit);
    if (!result.ok()) {
        return result.error();
    }
    return SessionResult<void>::success();
}

SessionResult<void> SessionManager::markAuthenticated(const SessionId& id) {
    SessionEdit edit;
    edit.authenticated = true;
    auto result = applyEdit(id, edit);
    if (!result.ok()) {
        return result.error();
    }
    return SessionResult<void>::success();
}

// ===================================================================
// OPERATOR ACTIONS
// ===================================================================

size_t SessionManager::resetStore() {
    size_t discarded = store_.reset();
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        last_cleanup_ = std::chrono::steady_clock::now();
    }
    emit({SessionEvent{SessionEventType::Reset, "", std::nullopt, std::chrono::system_clock::now(),
                       "discarded=" + std::to_string(discarded)}});
    return discarded;
}

void SessionManager::onEvent(EventListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

// ===================================================================
// HELPER METHODS
// ===================================================================

void SessionManager::notePoisoned(const SessionError& error) const {
    emit({SessionEvent{SessionEventType::Poisoned, "", std::nullopt, std::chrono::system_clock::now(),
                       error.detail().empty() ? "store unusable until reset" : error.detail()}});
}

void SessionManager::emit(const std::vector<SessionEvent>& events) const {
    if (events.empty()) {
        return;
    }
    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& event : events) {
        if (logger_ && logger_->shouldLog(levelFor(event.type))) {
            logger_->log(levelFor(event.type), event.toAuditString());
        }
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& ex) {
                if (logger_) {
                    logger_->error("Session event listener failed: " + std::string(ex.what()));
                }
            }
        }
    }
}
