#ifndef CAPTCHA_CONFIG_HPP
#define CAPTCHA_CONFIG_HPP

#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct CaptchaConfig {
    // Full-but-wrong buffer states tolerated before the challenge is regenerated
    int max_failures;

    // "jpeg" or "png"
    std::string image_format;

    // Encoder quality in (0, 1]
    double image_quality;

    // Deterministic synthesis for tests. Leave unset in production.
    std::optional<uint32_t> seed;

    bool log_events;

    CaptchaConfig()
        : max_failures(10), image_format("jpeg"), image_quality(0.8), log_events(true) {}

    // Throws InvalidArgument when a value is out of range
    void validate() const;

    // Override fields from CAPTCHA_* environment variables
    void applyEnvironment();

    // Command line flags, highest precedence. Unset flags leave the field alone.
    void applyOverrides(const std::optional<int>& max_failures_flag,
                        const std::optional<std::string>& image_format_flag);

    json toJson() const;

    // Missing keys keep their defaults
    static CaptchaConfig fromJson(const json& j);

    static CaptchaConfig loadFromFile(const std::string& path);
};

#endif // CAPTCHA_CONFIG_HPP
