#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include "core/IdGenerator.h"
#include "core/Logger.h"
#include "core/SessionConfig.h"
#include "core/SessionEvent.h"
#include "core/SessionRecord.h"
#include "core/SessionResult.h"
#include "core/SessionStore.h"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct SessionStats {
    size_t total = 0;          // physically present
    size_t active = 0;         // not expired
    size_t expired = 0;        // expired, awaiting cleanup
    size_t authenticated = 0;  // active and authenticated
};

class SessionManager {
public:
    using EventListener = std::function<void(const SessionEvent&)>;
    using Mutator = std::function<void(SessionRecord&)>;

    // Throws std::invalid_argument on a bad config, std::runtime_error if the
    // RNG is unavailable. A null logger means events are not logged.
    explicit SessionManager(const SessionConfig& config, std::shared_ptr<Logger> logger = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Mint a token and insert a fresh record (capacity policy applies).
    // LimitExceeded when the owner already holds max_sessions_per_owner live sessions.
    SessionResult<SessionRecord> create(const std::optional<std::string>& owner = std::nullopt);
    // Insert or overwrite a caller-built record
    SessionResult<void> store(const SessionRecord& record);

    // Read-only lookup; an expired record is reported, not removed
    SessionResult<SessionRecord> get(const SessionId& id) const;
    // Reset last_activity; never revives an expired record
    SessionResult<void> refresh(const SessionId& id);
    // Lookup + expiry check + refresh in one critical section. Request
    // handlers should prefer this over get() followed by refresh().
    SessionResult<SessionRecord> getAndRefresh(const SessionId& id);

    SessionResult<std::optional<SessionRecord>> remove(const SessionId& id);
    // Drops every record owned by `owner`, expired or not. Returns how many.
    SessionResult<size_t> removeAllForOwner(const std::string& owner);
    SessionResult<size_t> cleanupExpired();
    // Cleanup only if cleanup_interval has passed since the last one
    SessionResult<std::optional<size_t>> maybeCleanup();

    SessionResult<size_t> activeCount() const;
    SessionResult<size_t> size() const;
    SessionResult<std::vector<SessionRecord>> sessionsForOwner(const std::string& owner) const;
    SessionResult<SessionStats> stats() const;

    // Metadata and the authenticated flag only change through these.
    // They do not count as activity.
    //
    // The mutator runs on a copy with no lock held and may call back into the
    // manager. Only its metadata and authenticated changes are committed, and
    // only if the record is still present and live. If it throws, nothing is
    // committed and the exception reaches the caller.
    SessionResult<SessionRecord> update(const SessionId& id, const Mutator& mutator);
    SessionResult<void> setMetadata(const SessionId& id, const std::string& key, const std::string& value);
    SessionResult<void> markAuthenticated(const SessionId& id);

    bool isPoisoned() const { return store_.isPoisoned(); }
    // Operator action after LockPoisoned: discards every record
    size_t resetStore();

    void onEvent(EventListener listener);

    const SessionConfig& config() const { return config_; }
    const IdGenerator& idGenerator() const { return generator_; }

private:
    friend class SessionManagerTestPeer;

    static constexpr int kMaxIdAttempts = 5;

    // Changes committed by update(); a nullopt value erases the key
    struct SessionEdit {
        std::map<std::string, std::optional<std::string>> metadata;
        std::optional<bool> authenticated;
    };

    // Every exclusive section goes through here so that the call which
    // poisons the store is the only one to report it
    template <typename Fn>
    auto exclusive(Fn&& fn) -> decltype(fn(std::declval<SessionMap&>())) {
        bool became_poisoned = false;
        auto result = store_.withExclusive(std::forward<Fn>(fn), &became_poisoned);
        if (became_poisoned) {
            notePoisoned(result.error());
        }
        return result;
    }

    SessionResult<void> insert(const SessionRecord& record, bool overwrite, SessionEventType event_type);
    SessionResult<SessionRecord> applyEdit(const SessionId& id, const SessionEdit& edit);
    void evictOne(SessionMap& sessions, std::vector<SessionEvent>& events) const;
    void emit(const std::vector<SessionEvent>& events) const;
    void notePoisoned(const SessionError& error) const;

    SessionConfig config_;
    IdGenerator generator_;
    std::shared_ptr<Logger> logger_;
    SessionStore store_;

    mutable std::mutex listeners_mutex_;
    std::vector<EventListener> listeners_;

    std::mutex cleanup_mutex_;
    std::chrono::steady_clock::time_point last_cleanup_;
};

#endif // SESSION_MANAGER_H
