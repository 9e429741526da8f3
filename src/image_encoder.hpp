#ifndef IMAGE_ENCODER_HPP
#define IMAGE_ENCODER_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

class ImageEncoder {
public:
    // format is "jpeg" or "png", quality in (0, 1].
    // Throws EncodingError when OpenCV has no writer for the format.
    explicit ImageEncoder(const std::string& format = "jpeg", double quality = 0.8);
    ~ImageEncoder() = default;

    // Compress a 24-bit BGR canvas
    std::vector<uchar> encode(const cv::Mat& image) const;

    // Decode a payload back to a BGR canvas, empty Mat on failure
    static cv::Mat decode(const std::vector<uchar>& bytes);

    // Validate canvas type and dimensions
    static bool validateImage(const cv::Mat& image, const cv::Size& expected);

    // MIME type for the configured format
    std::string contentType() const;

    const std::string& format() const { return format_; }
    double quality() const { return quality_; }

    static bool isValidImageFormat(const std::string& format);

private:
    std::string format_;
    double quality_;
    std::string extension_;
    std::vector<int> params_;

    static const std::vector<std::string> supported_formats;
};

#endif // IMAGE_ENCODER_HPP
