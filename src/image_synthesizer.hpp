#ifndef IMAGE_SYNTHESIZER_HPP
#define IMAGE_SYNTHESIZER_HPP

#include "sequence_generator.hpp"
#include <opencv2/opencv.hpp>
#include <random>
#include <vector>

// Renders the layered arrow challenge onto a 24-bit BGR canvas.
// All sizes scale linearly with the zoom level.
class ImageSynthesizer {
public:
    static constexpr int BASE_WIDTH = 180;
    static constexpr int BASE_HEIGHT = 35;
    static constexpr int ARROW_SIZE = 16;
    static constexpr int CIRCLE_SIZE = 24;
    static constexpr int ARROW_SPACING = 2;
    static constexpr int NOISE_FONT_SIZE = 12;
    static constexpr int MIN_ZOOM = 1;
    static constexpr int MAX_ZOOM = 4;

    ImageSynthesizer() = default;
    ~ImageSynthesizer() = default;

    // Render the full challenge canvas (180*zoom x 35*zoom, CV_8UC3).
    // Throws InvalidArgument for a zoom outside [1, 4] or a malformed sequence.
    cv::Mat render(const ArrowSequence& sequence, int zoom, std::mt19937& rng) const;

    static void validateZoom(int zoom);
    static cv::Size canvasSize(int zoom);

    // Seven-point arrow outline around a badge center
    static std::vector<cv::Point> arrowPolygon(const cv::Point& center, ArrowDirection direction, int zoom);

    // Horizontal centers of the six badges
    static std::vector<cv::Point> badgeCenters(int zoom);

private:
    void drawBackground(cv::Mat& canvas, int zoom, std::mt19937& rng) const;
    void drawBadges(cv::Mat& canvas, const ArrowSequence& sequence, int zoom, std::mt19937& rng) const;
    void drawBadge(cv::Mat& canvas, const cv::Point& center, int zoom, std::mt19937& rng) const;
    void drawArrow(cv::Mat& canvas, const cv::Point& center, ArrowDirection direction,
                   int zoom, std::mt19937& rng) const;
    void drawNoiseCharacters(cv::Mat& canvas, int zoom, std::mt19937& rng) const;
    void drawNoiseLines(cv::Mat& canvas, int zoom, std::mt19937& rng) const;
    void drawDistortionEffects(cv::Mat& canvas, int zoom, std::mt19937& rng) const;
};

#endif // IMAGE_SYNTHESIZER_HPP
