#include "session_store.hpp"

std::shared_ptr<ChallengeSession> SessionStore::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<ChallengeSession> SessionStore::swap(const std::string& session_id,
                                                     std::shared_ptr<ChallengeSession> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<ChallengeSession>& slot = sessions_[session_id];
    std::shared_ptr<ChallengeSession> previous = std::move(slot);
    slot = std::move(session);
    return previous;
}

std::shared_ptr<ChallengeSession> SessionStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    std::shared_ptr<ChallengeSession> previous = std::move(it->second);
    sessions_.erase(it);
    return previous;
}

bool SessionStore::removeIf(const std::string& session_id, const std::shared_ptr<ChallengeSession>& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second != expected) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionStore::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        result.push_back(entry.first);
    }
    return result;
}
