#include "post_processor.hpp"
#include "captcha_errors.hpp"
#include <algorithm>

int PostProcessor::pixelBlockSize(int zoom) {
    return std::max(1, zoom / 4);
}

int PostProcessor::blurKernelSize(int zoom) {
    return std::max(1, zoom / 6);
}

double PostProcessor::blurStrength(int zoom) {
    return 0.3 + 0.1 * zoom;
}

cv::Mat PostProcessor::apply(const cv::Mat& canvas, int zoom) const {
    if (zoom <= 1) {
        return canvas;
    }

    cv::Mat image = pixelate(canvas, pixelBlockSize(zoom));

    if (zoom > 2) {
        // A 1x1 kernel would only rescale intensities, so it is skipped
        int kernel_size = blurKernelSize(zoom);
        if (kernel_size > 1) {
            image = boxBlur(image, kernel_size, blurStrength(zoom));
        }
    }

    return image;
}

cv::Mat PostProcessor::pixelate(const cv::Mat& image, int block_size) {
    if (block_size < 1) {
        throw InvalidArgument("Pixelation block size must be positive");
    }
    if (image.type() != CV_8UC3) {
        throw InvalidArgument("Pixelation expects a 24-bit BGR image");
    }
    if (block_size == 1) {
        return image.clone();
    }

    cv::Mat result(image.size(), image.type());
    for (int y = 0; y < image.rows; y += block_size) {
        for (int x = 0; x < image.cols; x += block_size) {
            const cv::Vec3b& sample = image.at<cv::Vec3b>(y, x);
            cv::Rect block(x, y, std::min(block_size, image.cols - x), std::min(block_size, image.rows - y));
            result(block).setTo(cv::Scalar(sample[0], sample[1], sample[2]));
        }
    }
    return result;
}

cv::Mat PostProcessor::boxBlur(const cv::Mat& image, int kernel_size, double strength) {
    if (kernel_size < 1) {
        throw InvalidArgument("Blur kernel size must be positive");
    }

    cv::Mat kernel(kernel_size, kernel_size, CV_32F,
                   cv::Scalar(strength / (kernel_size * kernel_size)));
    int anchor = (kernel_size - 1) / 2;

    cv::Mat filtered;
    cv::filter2D(image, filtered, -1, kernel, cv::Point(anchor, anchor), 0.0, cv::BORDER_CONSTANT);

    // Only the interior, where the kernel fits entirely, takes the filtered value
    cv::Mat result = image.clone();
    cv::Rect interior(anchor, anchor, image.cols - kernel_size + 1, image.rows - kernel_size + 1);
    if (interior.width > 0 && interior.height > 0) {
        filtered(interior).copyTo(result(interior));
    }
    return result;
}
