#include "challenge_session.hpp"
#include "captcha_errors.hpp"
#include <algorithm>

ChallengeSession::ChallengeSession(std::string session_id, ArrowSequence correct_sequence,
                                   int zoom, std::vector<uchar> image_bytes)
    : session_id_(std::move(session_id)),
      correct_sequence_(std::move(correct_sequence)),
      zoom_(zoom),
      fail_count_(0),
      image_bytes_(std::move(image_bytes)),
      disposed_(false) {
    if (static_cast<int>(correct_sequence_.size()) != SEQUENCE_LENGTH) {
        throw InvalidArgument("Correct sequence must have exactly 6 symbols");
    }
}

ChallengeSession::~ChallengeSession() {
    dispose();
}

bool ChallengeSession::addInput(int symbol) {
    if (isDisposed() || !isValidSymbol(symbol)) {
        return false;
    }

    bool matched = false;
    {
        std::lock_guard<std::mutex> lock(input_mutex_);
        if (isDisposed()) {
            return false;
        }

        if (static_cast<int>(entered_.size()) >= SEQUENCE_LENGTH) {
            entered_.pop_front();
        }
        entered_.push_back(static_cast<ArrowDirection>(symbol));
        matched = matchesLocked();
    }

    // Only the caller that wins the disposal reports completion
    return matched && dispose();
}

bool ChallengeSession::verify() const {
    std::lock_guard<std::mutex> lock(input_mutex_);
    return matchesLocked();
}

bool ChallengeSession::matchesLocked() const {
    return static_cast<int>(entered_.size()) == SEQUENCE_LENGTH &&
           std::equal(entered_.begin(), entered_.end(), correct_sequence_.begin());
}

std::vector<uchar> ChallengeSession::getImageBytes() const {
    if (isDisposed()) {
        throw DisposedError("Challenge for session " + session_id_ + " has been disposed");
    }

    std::lock_guard<std::mutex> lock(resource_mutex_);
    if (isDisposed()) {
        throw DisposedError("Challenge for session " + session_id_ + " has been disposed");
    }
    return image_bytes_;
}

size_t ChallengeSession::imageSize() const {
    std::lock_guard<std::mutex> lock(resource_mutex_);
    return image_bytes_.size();
}

std::string ChallengeSession::getEnteredValue() const {
    std::lock_guard<std::mutex> lock(input_mutex_);
    std::string value;
    value.reserve(entered_.size());
    for (const auto& dir : entered_) {
        value.push_back(static_cast<char>('0' + static_cast<int>(dir)));
    }
    return value;
}

size_t ChallengeSession::getEnteredLength() const {
    std::lock_guard<std::mutex> lock(input_mutex_);
    return entered_.size();
}

int ChallengeSession::getFailCount() const {
    std::lock_guard<std::mutex> lock(input_mutex_);
    return fail_count_;
}

int ChallengeSession::recordFailure() {
    std::lock_guard<std::mutex> lock(input_mutex_);
    return ++fail_count_;
}

bool ChallengeSession::dispose() {
    bool expected = false;
    if (!disposed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(resource_mutex_);
        std::vector<uchar>().swap(image_bytes_);
    }
    {
        std::lock_guard<std::mutex> lock(input_mutex_);
        entered_.clear();
    }
    return true;
}
