#ifndef CHALLENGE_MANAGER_HPP
#define CHALLENGE_MANAGER_HPP

#include "captcha_config.hpp"
#include "challenge_session.hpp"
#include "image_encoder.hpp"
#include "image_synthesizer.hpp"
#include "post_processor.hpp"
#include "sequence_generator.hpp"
#include "session_store.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class InputOutcome {
    PENDING = 0,
    SOLVED = 1,
    REGENERATED = 2,
    ABSENT = 3
};

std::string inputOutcomeToString(InputOutcome outcome);

// Public view of a live challenge. Never carries the answer.
struct ChallengeInfo {
    std::string session_id;
    int zoom;
    int width;
    int height;
    size_t entered_length;
    int fail_count;
    size_t image_bytes;

    ChallengeInfo() : zoom(0), width(0), height(0), entered_length(0), fail_count(0), image_bytes(0) {}

    json toJson() const {
        json j;
        j["session_id"] = session_id;
        j["zoom"] = zoom;
        j["width"] = width;
        j["height"] = height;
        j["entered_length"] = entered_length;
        j["fail_count"] = fail_count;
        j["image_bytes"] = image_bytes;
        return j;
    }
};

// Replaces the random answer draw, mainly for tests that must know the answer
using SequenceSource = std::function<ArrowSequence(std::mt19937&)>;

class ChallengeManager {
public:
    // Throws InvalidArgument for a bad config and EncodingError when the
    // configured image format cannot be written.
    explicit ChallengeManager(CaptchaConfig config = CaptchaConfig(),
                              SequenceSource sequence_source = nullptr);
    ~ChallengeManager() = default;

    ChallengeManager(const ChallengeManager&) = delete;
    ChallengeManager& operator=(const ChallengeManager&) = delete;

    // Replace any challenge for the id with a freshly rendered one.
    // Throws InvalidArgument (zoom outside 1..4, nothing changed),
    // EncodingError or GenerationFailed (old challenge already gone).
    void generate(const std::string& session_id, int zoom);

    // Same as generate() on a worker thread. The zoom is checked before dispatch.
    std::future<void> generateAsync(const std::string& session_id, int zoom);

    bool contains(const std::string& session_id) const;

    // Encoded image of the live challenge
    std::optional<std::vector<uchar>> getChallenge(const std::string& session_id) const;

    std::optional<ChallengeInfo> getChallengeInfo(const std::string& session_id) const;

    // Route one symbol to the live challenge. Symbols outside 0..2, including
    // values too wide for an int, are ignored and report PENDING.
    InputOutcome submitInput(const std::string& session_id, int64_t symbol);

    void removeChallenge(const std::string& session_id);

    size_t activeCount() const;
    std::vector<std::string> sessionIds() const;

    const CaptchaConfig& config() const { return config_; }
    std::string contentType() const { return encoder_.contentType(); }

private:
    std::shared_ptr<ChallengeSession> buildSession(const std::string& session_id, int zoom);
    void install(const std::string& session_id, std::shared_ptr<ChallengeSession> session);
    InputOutcome regenerate(const std::string& session_id, const std::shared_ptr<ChallengeSession>& session);
    uint32_t nextSeed();

    CaptchaConfig config_;
    SequenceSource sequence_source_;
    ImageSynthesizer synthesizer_;
    PostProcessor post_processor_;
    ImageEncoder encoder_;
    SessionStore store_;
    std::atomic<uint32_t> seed_counter_;
};

#endif // CHALLENGE_MANAGER_HPP
