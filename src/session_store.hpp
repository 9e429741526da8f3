#ifndef SESSION_STORE_HPP
#define SESSION_STORE_HPP

#include "challenge_session.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Session id -> the one live challenge for that id.
// Every mutation is a single critical section, so install/remove/replace for
// an id are atomic with respect to each other. Sessions handed out are never
// disposed here; whoever displaces a session disposes it.
class SessionStore {
public:
    SessionStore() = default;
    ~SessionStore() = default;

    std::shared_ptr<ChallengeSession> get(const std::string& session_id) const;

    // Install a session and return the one it displaced (null if none)
    std::shared_ptr<ChallengeSession> swap(const std::string& session_id,
                                           std::shared_ptr<ChallengeSession> session);

    // Remove and return the session for the id (null if none)
    std::shared_ptr<ChallengeSession> remove(const std::string& session_id);

    // Remove only if the stored session is still `expected`
    bool removeIf(const std::string& session_id, const std::shared_ptr<ChallengeSession>& expected);

    size_t size() const;

    // Snapshot of stored ids, for host side expiry sweeps
    std::vector<std::string> ids() const;

private:
    std::unordered_map<std::string, std::shared_ptr<ChallengeSession>> sessions_;
    mutable std::mutex mutex_;
};

#endif // SESSION_STORE_HPP
