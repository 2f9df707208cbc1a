#pragma once
#include "core/SessionId.h"
#include "core/SessionRecord.h"
#include "core/SessionResult.h"
#include <atomic>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

using SessionMap = std::unordered_map<SessionId, SessionRecord>;

// Token -> record map behind a single reader/writer lock.
//
// All access goes through withShared()/withExclusive(). The callback returns
// a SessionResult<T>; the wrapper adds the LockPoisoned outcome:
//   - an exclusive callback that exits by exception poisons the store before
//     the lock is released. std::exception is reported to that caller as
//     LockPoisoned; anything else keeps propagating (still poisoned).
//   - once poisoned, every access returns LockPoisoned without running the
//     callback, until reset().
class SessionStore {
public:
    SessionStore() = default;
    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    template <typename Fn>
    auto withShared(Fn&& fn) const -> decltype(fn(std::declval<const SessionMap&>())) {
        using Result = decltype(fn(std::declval<const SessionMap&>()));
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (poisoned_.load()) {
            return Result(SessionError::lockPoisoned(poison_reason_));
        }
        return fn(static_cast<const SessionMap&>(sessions_));
    }

    // `became_poisoned`, when given, is set only for the one call whose
    // failure moved the store from healthy to poisoned.
    template <typename Fn>
    auto withExclusive(Fn&& fn, bool* became_poisoned = nullptr) -> decltype(fn(std::declval<SessionMap&>())) {
        using Result = decltype(fn(std::declval<SessionMap&>()));
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (poisoned_.load()) {
            return Result(SessionError::lockPoisoned(poison_reason_));
        }
        PoisonGuard guard(*this, became_poisoned);
        try {
            return fn(sessions_);
        } catch (const std::exception& e) {
            bool transitioned = poison(e.what());
            if (became_poisoned) {
                *became_poisoned = transitioned;
            }
            return Result(SessionError::lockPoisoned(e.what()));
        }
    }

    bool isPoisoned() const { return poisoned_.load(); }

    // Operator action: drop every record and clear the poison flag.
    // Returns how many records were discarded.
    size_t reset();

private:
    // Marks the store poisoned if destroyed while an exception is in flight
    class PoisonGuard {
    public:
        PoisonGuard(SessionStore& store, bool* became_poisoned)
            : store_(store), became_poisoned_(became_poisoned), exceptions_(std::uncaught_exceptions()) {}
        ~PoisonGuard() {
            if (std::uncaught_exceptions() > exceptions_) {
                bool transitioned = store_.poison("non-standard exception while holding exclusive lock");
                if (became_poisoned_) {
                    *became_poisoned_ = transitioned;
                }
            }
        }
    private:
        SessionStore& store_;
        bool* became_poisoned_;
        int exceptions_;
    };

    // Caller holds the exclusive lock. Returns true if this call poisoned
    // a healthy store.
    bool poison(const std::string& reason);

    mutable std::shared_mutex mutex_;
    std::atomic<bool> poisoned_{false};
    std::string poison_reason_;
    SessionMap sessions_;
};
