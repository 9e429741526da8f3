#include "image_encoder.hpp"
#include "captcha_errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>

const std::vector<std::string> ImageEncoder::supported_formats = {"jpeg", "png"};

ImageEncoder::ImageEncoder(const std::string& format, double quality)
    : quality_(quality) {
    format_ = format;
    std::transform(format_.begin(), format_.end(), format_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (format_ == "jpg") {
        format_ = "jpeg";
    }

    if (!isValidImageFormat(format_)) {
        throw EncodingError("Unsupported image format: " + format);
    }
    if (!(quality_ > 0.0 && quality_ <= 1.0)) {
        throw InvalidArgument("Image quality must be in (0, 1]");
    }

    if (format_ == "jpeg") {
        extension_ = ".jpg";
        params_ = {cv::IMWRITE_JPEG_QUALITY, static_cast<int>(std::lround(quality_ * 100.0))};
    } else {
        // Higher quality means less effort spent compressing, PNG stays lossless
        extension_ = ".png";
        int level = static_cast<int>(std::lround((1.0 - quality_) * 9.0));
        params_ = {cv::IMWRITE_PNG_COMPRESSION, std::max(0, std::min(9, level))};
    }

    if (!cv::haveImageWriter(extension_)) {
        throw EncodingError("No " + format_ + " encoder available in this OpenCV build");
    }
}

std::vector<uchar> ImageEncoder::encode(const cv::Mat& image) const {
    if (image.empty() || image.type() != CV_8UC3) {
        throw EncodingError("Encoder expects a non-empty 24-bit BGR image");
    }

    std::vector<uchar> bytes;
    bool ok = false;
    try {
        ok = cv::imencode(extension_, image, bytes, params_);
    } catch (const cv::Exception& e) {
        throw EncodingError(std::string("Failed to encode ") + format_ + " image: " + e.what());
    }

    if (!ok || bytes.empty()) {
        throw EncodingError("Failed to encode " + format_ + " image");
    }
    return bytes;
}

cv::Mat ImageEncoder::decode(const std::vector<uchar>& bytes) {
    if (bytes.empty()) {
        return cv::Mat();
    }

    try {
        return cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "Error decoding captcha image: " << e.what() << std::endl;
        return cv::Mat();
    }
}

bool ImageEncoder::validateImage(const cv::Mat& image, const cv::Size& expected) {
    if (image.empty()) {
        return false;
    }
    if (image.type() != CV_8UC3) {
        return false;
    }
    return image.cols == expected.width && image.rows == expected.height;
}

std::string ImageEncoder::contentType() const {
    return format_ == "png" ? "image/png" : "image/jpeg";
}

bool ImageEncoder::isValidImageFormat(const std::string& format) {
    std::string lower_format = format;
    std::transform(lower_format.begin(), lower_format.end(), lower_format.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::find(supported_formats.begin(), supported_formats.end(), lower_format) != supported_formats.end();
}
