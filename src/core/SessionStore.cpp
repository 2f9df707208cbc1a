#include "core/SessionStore.h"

bool SessionStore::poison(const std::string& reason) {
    if (poisoned_.load()) {
        return false;
    }
    poison_reason_ = reason;
    poisoned_.store(true);
    return true;
}

size_t SessionStore::reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t discarded = sessions_.size();
    // Contents cannot be trusted after a poisoning, so nothing is kept
    SessionMap().swap(sessions_);
    poison_reason_.clear();
    poisoned_.store(false);
    return discarded;
}
