#include "captcha_config.hpp"
#include "captcha_errors.hpp"
#include <fstream>
#include <cctype>
#include <cstdlib>
#include <algorithm>

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const char* readEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

void CaptchaConfig::validate() const {
    if (max_failures < 1) {
        throw InvalidArgument("max_failures must be at least 1");
    }
    if (image_format != "jpeg" && image_format != "png") {
        throw InvalidArgument("image_format must be \"jpeg\" or \"png\", got \"" + image_format + "\"");
    }
    if (!(image_quality > 0.0 && image_quality <= 1.0)) {
        throw InvalidArgument("image_quality must be in (0, 1]");
    }
}

void CaptchaConfig::applyEnvironment() {
    try {
        if (const char* value = readEnv("CAPTCHA_MAX_FAILURES")) {
            max_failures = std::stoi(value);
        }
        if (const char* value = readEnv("CAPTCHA_IMAGE_FORMAT")) {
            image_format = toLower(value);
            if (image_format == "jpg") image_format = "jpeg";
        }
        if (const char* value = readEnv("CAPTCHA_IMAGE_QUALITY")) {
            image_quality = std::stod(value);
        }
        if (const char* value = readEnv("CAPTCHA_SEED")) {
            seed = static_cast<uint32_t>(std::stoul(value));
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends report malformed numbers as invalid_argument/out_of_range
        throw InvalidArgument(std::string("Invalid CAPTCHA_* environment value: ") + e.what());
    }
    validate();
}

void CaptchaConfig::applyOverrides(const std::optional<int>& max_failures_flag,
                                   const std::optional<std::string>& image_format_flag) {
    if (max_failures_flag) {
        max_failures = *max_failures_flag;
    }
    if (image_format_flag) {
        image_format = toLower(*image_format_flag);
        if (image_format == "jpg") image_format = "jpeg";
    }
    validate();
}

json CaptchaConfig::toJson() const {
    json j;
    j["max_failures"] = max_failures;
    j["image_format"] = image_format;
    j["image_quality"] = image_quality;
    j["seed"] = seed ? json(*seed) : json(nullptr);
    j["log_events"] = log_events;
    return j;
}

CaptchaConfig CaptchaConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw InvalidArgument("Captcha configuration must be a JSON object");
    }

    CaptchaConfig config;
    try {
        if (j.contains("max_failures")) {
            config.max_failures = j["max_failures"].get<int>();
        }
        if (j.contains("image_format")) {
            config.image_format = toLower(j["image_format"].get<std::string>());
            if (config.image_format == "jpg") config.image_format = "jpeg";
        }
        if (j.contains("image_quality")) {
            config.image_quality = j["image_quality"].get<double>();
        }
        if (j.contains("seed") && !j["seed"].is_null()) {
            config.seed = j["seed"].get<uint32_t>();
        }
        if (j.contains("log_events")) {
            config.log_events = j["log_events"].get<bool>();
        }
    } catch (const json::exception& e) {
        throw InvalidArgument(std::string("Invalid captcha configuration: ") + e.what());
    }

    config.validate();
    return config;
}

CaptchaConfig CaptchaConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw InvalidArgument("Cannot open configuration file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw InvalidArgument("Invalid JSON in configuration file " + path + ": " + e.what());
    }
    return fromJson(j);
}
