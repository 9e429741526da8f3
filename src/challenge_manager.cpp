#include "challenge_manager.hpp"
#include "captcha_errors.hpp"
#include <chrono>
#include <iostream>

namespace {

CaptchaConfig validatedConfig(CaptchaConfig config) {
    config.validate();
    return config;
}

} // namespace

std::string inputOutcomeToString(InputOutcome outcome) {
    switch (outcome) {
        case InputOutcome::PENDING: return "pending";
        case InputOutcome::SOLVED: return "solved";
        case InputOutcome::REGENERATED: return "regenerated";
        case InputOutcome::ABSENT: return "absent";
        default: return "unknown";
    }
}

ChallengeManager::ChallengeManager(CaptchaConfig config, SequenceSource sequence_source)
    : config_(validatedConfig(std::move(config))),
      sequence_source_(std::move(sequence_source)),
      encoder_(config_.image_format, config_.image_quality),
      seed_counter_(0) {
}

void ChallengeManager::generate(const std::string& session_id, int zoom) {
    ImageSynthesizer::validateZoom(zoom);

    // The old challenge goes first; the new one is rendered without holding the store
    if (auto previous = store_.remove(session_id)) {
        previous->dispose();
    }

    std::shared_ptr<ChallengeSession> session;
    try {
        session = buildSession(session_id, zoom);
    } catch (const std::exception& e) {
        std::cerr << "Error generating challenge for session " << session_id << ": " << e.what() << std::endl;
        throw;
    }

    install(session_id, std::move(session));
}

std::future<void> ChallengeManager::generateAsync(const std::string& session_id, int zoom) {
    ImageSynthesizer::validateZoom(zoom);

    return std::async(std::launch::async, [this, session_id, zoom]() {
        generate(session_id, zoom);
    });
}

bool ChallengeManager::contains(const std::string& session_id) const {
    auto session = store_.get(session_id);
    return session && !session->isDisposed();
}

std::optional<std::vector<uchar>> ChallengeManager::getChallenge(const std::string& session_id) const {
    auto session = store_.get(session_id);
    if (!session || session->isDisposed()) {
        return std::nullopt;
    }

    try {
        return session->getImageBytes();
    } catch (const DisposedError&) {
        // Disposed between the lookup and the copy
        return std::nullopt;
    }
}

std::optional<ChallengeInfo> ChallengeManager::getChallengeInfo(const std::string& session_id) const {
    auto session = store_.get(session_id);
    if (!session || session->isDisposed()) {
        return std::nullopt;
    }

    cv::Size size = ImageSynthesizer::canvasSize(session->zoom());

    ChallengeInfo info;
    info.session_id = session_id;
    info.zoom = session->zoom();
    info.width = size.width;
    info.height = size.height;
    info.entered_length = session->getEnteredLength();
    info.fail_count = session->getFailCount();
    info.image_bytes = session->imageSize();
    return info;
}

InputOutcome ChallengeManager::submitInput(const std::string& session_id, int64_t symbol) {
    auto session = store_.get(session_id);
    if (!session || session->isDisposed()) {
        return InputOutcome::ABSENT;
    }

    // Out of range symbols are ignored, they never count as a failure
    if (!isValidSymbol(symbol)) {
        return InputOutcome::PENDING;
    }

    if (session->addInput(static_cast<int>(symbol))) {
        store_.removeIf(session_id, session);
        if (config_.log_events) {
            std::cout << "Challenge for session " << session_id << " solved" << std::endl;
        }
        return InputOutcome::SOLVED;
    }

    if (session->isDisposed()) {
        // Removed or replaced while this input was in flight
        return contains(session_id) ? InputOutcome::PENDING : InputOutcome::ABSENT;
    }

    // The window is re-checked on every keystroke once it is full
    if (static_cast<int>(session->getEnteredLength()) < SEQUENCE_LENGTH) {
        return InputOutcome::PENDING;
    }

    int failures = session->recordFailure();
    if (failures < config_.max_failures) {
        return InputOutcome::PENDING;
    }

    return regenerate(session_id, session);
}

InputOutcome ChallengeManager::regenerate(const std::string& session_id,
                                          const std::shared_ptr<ChallengeSession>& session) {
    // Only the challenge this input was aimed at gets replaced
    if (!store_.removeIf(session_id, session)) {
        return contains(session_id) ? InputOutcome::PENDING : InputOutcome::ABSENT;
    }

    int failures = session->getFailCount();
    session->dispose();

    if (config_.log_events) {
        std::cout << "Challenge for session " << session_id << " reached " << failures
                  << " failures, regenerating" << std::endl;
    }

    std::shared_ptr<ChallengeSession> replacement;
    try {
        replacement = buildSession(session_id, session->zoom());
    } catch (const std::exception& e) {
        std::cerr << "Error regenerating challenge for session " << session_id << ": " << e.what() << std::endl;
        throw;
    }

    install(session_id, std::move(replacement));
    return InputOutcome::REGENERATED;
}

void ChallengeManager::removeChallenge(const std::string& session_id) {
    auto session = store_.remove(session_id);
    if (!session) {
        return;
    }

    session->dispose();
    if (config_.log_events) {
        std::cout << "Challenge for session " << session_id << " removed" << std::endl;
    }
}

size_t ChallengeManager::activeCount() const {
    return store_.size();
}

std::vector<std::string> ChallengeManager::sessionIds() const {
    return store_.ids();
}

std::shared_ptr<ChallengeSession> ChallengeManager::buildSession(const std::string& session_id, int zoom) {
    auto start_time = std::chrono::steady_clock::now();

    try {
        std::mt19937 rng(nextSeed());

        ArrowSequence sequence = sequence_source_ ? sequence_source_(rng)
                                                  : SequenceGenerator::generateSequence(rng);
        if (static_cast<int>(sequence.size()) != SEQUENCE_LENGTH) {
            throw GenerationFailed("Sequence source returned " + std::to_string(sequence.size()) + " symbols");
        }
        for (const auto& dir : sequence) {
            if (!isValidSymbol(static_cast<int>(dir))) {
                throw GenerationFailed("Sequence source returned unknown symbol " +
                                       std::to_string(static_cast<int>(dir)));
            }
        }

        cv::Mat canvas = synthesizer_.render(sequence, zoom, rng);
        cv::Mat processed = post_processor_.apply(canvas, zoom);
        std::vector<uchar> image_bytes = encoder_.encode(processed);

        auto session = std::make_shared<ChallengeSession>(session_id, std::move(sequence), zoom,
                                                          std::move(image_bytes));

        if (config_.log_events) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
            std::cout << "Generated challenge for session " << session_id << " (zoom " << zoom << ", "
                      << session->imageSize() << " bytes, " << elapsed << " ms)" << std::endl;
        }
        return session;

    } catch (const CaptchaError&) {
        throw;
    } catch (const InvalidArgument&) {
        throw;
    } catch (const std::exception& e) {
        // OpenCV and allocation failures end up here
        throw GenerationFailed("Failed to generate challenge for session " + session_id + ": " + e.what());
    }
}

void ChallengeManager::install(const std::string& session_id, std::shared_ptr<ChallengeSession> session) {
    // A concurrent generate may have installed its own challenge meanwhile
    if (auto displaced = store_.swap(session_id, std::move(session))) {
        displaced->dispose();
    }
}

uint32_t ChallengeManager::nextSeed() {
    if (config_.seed) {
        return *config_.seed + seed_counter_.fetch_add(1);
    }
    return std::random_device{}();
}
