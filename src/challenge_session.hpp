#ifndef CHALLENGE_SESSION_HPP
#define CHALLENGE_SESSION_HPP

#include "sequence_generator.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// One live challenge: the secret answer, the sliding input window, the
// failure counter and the encoded image.
//
// Input state (entered buffer, fail count) and the image are guarded by two
// independent mutexes. The disposed flag is a lock-free atomic so cleanup
// runs exactly once no matter how many callers race on dispose().
class ChallengeSession {
public:
    ChallengeSession(std::string session_id, ArrowSequence correct_sequence,
                     int zoom, std::vector<uchar> image_bytes);
    ~ChallengeSession();

    ChallengeSession(const ChallengeSession&) = delete;
    ChallengeSession& operator=(const ChallengeSession&) = delete;

    // Append one symbol to the sliding window of the last six inputs.
    // Returns true when the window matches the answer; the session is then
    // disposed. Disposed sessions and symbols outside 0..2 return false
    // without touching any state.
    bool addInput(int symbol);

    // True when the current full window equals the answer
    bool verify() const;

    // Copy of the encoded image. Throws DisposedError once disposed.
    std::vector<uchar> getImageBytes() const;

    size_t imageSize() const;

    // Entered symbols as a digit string, oldest first
    std::string getEnteredValue() const;
    size_t getEnteredLength() const;

    int getFailCount() const;

    // Bump the failure counter, returns the new value
    int recordFailure();

    // Release the image and clear the input window. Returns true only for the
    // call that actually performed the release.
    bool dispose();

    bool isDisposed() const { return disposed_.load(std::memory_order_acquire); }

    const std::string& sessionId() const { return session_id_; }
    int zoom() const { return zoom_; }

private:
    bool matchesLocked() const;

    const std::string session_id_;
    const ArrowSequence correct_sequence_;
    const int zoom_;

    mutable std::mutex input_mutex_;
    std::deque<ArrowDirection> entered_;
    int fail_count_;

    mutable std::mutex resource_mutex_;
    std::vector<uchar> image_bytes_;

    std::atomic<bool> disposed_;
};

#endif // CHALLENGE_SESSION_HPP
