#ifndef POST_PROCESSOR_HPP
#define POST_PROCESSOR_HPP

#include <opencv2/opencv.hpp>

// Zoom dependent degradation applied to a finished canvas
class PostProcessor {
public:
    PostProcessor() = default;
    ~PostProcessor() = default;

    // zoom 1 passes through, zoom > 1 pixelates, zoom > 2 also blurs
    cv::Mat apply(const cv::Mat& canvas, int zoom) const;

    // Fill each block_size square with its top-left pixel. Block size 1 is a copy.
    static cv::Mat pixelate(const cv::Mat& image, int block_size);

    // Uniform kernel_size x kernel_size convolution whose weights sum to strength.
    // Pixels whose kernel would read outside the image keep their value.
    static cv::Mat boxBlur(const cv::Mat& image, int kernel_size, double strength);

    static int pixelBlockSize(int zoom);
    static int blurKernelSize(int zoom);
    static double blurStrength(int zoom);
};

#endif // POST_PROCESSOR_HPP
