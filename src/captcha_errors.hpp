#ifndef CAPTCHA_ERRORS_HPP
#define CAPTCHA_ERRORS_HPP

#include <stdexcept>
#include <string>

// Zoom, symbol or configuration value outside its allowed range.
// Raised before any state is touched.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& message)
        : std::invalid_argument(message) {}
};

// Base of the runtime failures raised by the captcha core
class CaptchaError : public std::runtime_error {
public:
    explicit CaptchaError(const std::string& message)
        : std::runtime_error(message) {}
};

// Resource accessor called on a session that was already disposed.
// Callers treat it the same way as a missing session.
class DisposedError : public CaptchaError {
public:
    explicit DisposedError(const std::string& message)
        : CaptchaError(message) {}
};

// No image writer for the configured format. Configuration problem, never retried.
class EncodingError : public CaptchaError {
public:
    explicit EncodingError(const std::string& message)
        : CaptchaError(message) {}
};

// Any other failure inside the synthesis pipeline
class GenerationFailed : public CaptchaError {
public:
    explicit GenerationFailed(const std::string& message)
        : CaptchaError(message) {}
};

#endif // CAPTCHA_ERRORS_HPP
