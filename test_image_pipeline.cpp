#include "src/image_synthesizer.hpp"
#include "src/post_processor.hpp"
#include "src/image_encoder.hpp"
#include "src/captcha_errors.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>

static int failures = 0;

static void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "  ✅ " << name << std::endl;
    } else {
        std::cout << "  ❌ FAILED: " << name << std::endl;
        failures++;
    }
}

static bool sameImage(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

static cv::Mat randomImage(int width, int height, unsigned seed) {
    cv::Mat image(height, width, CV_8UC3);
    cv::RNG rng(seed);
    rng.fill(image, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
    return image;
}

static void testDimensions() {
    std::cout << "\n=== Canvas dimensions per zoom ===\n";

    ImageSynthesizer synthesizer;
    PostProcessor post_processor;
    ImageEncoder encoder("jpeg", 0.8);
    ArrowSequence sequence = sequenceFromString("021102");

    for (int zoom = 1; zoom <= 4; ++zoom) {
        std::mt19937 rng(static_cast<uint32_t>(zoom));
        cv::Mat canvas = synthesizer.render(sequence, zoom, rng);
        cv::Mat processed = post_processor.apply(canvas, zoom);
        cv::Size expected(180 * zoom, 35 * zoom);

        check(ImageEncoder::validateImage(canvas, expected),
              "zoom " + std::to_string(zoom) + " canvas is " + std::to_string(expected.width) + "x" +
              std::to_string(expected.height) + " BGR");
        check(processed.size() == expected, "zoom " + std::to_string(zoom) + " post-processing keeps size");

        std::vector<uchar> bytes = encoder.encode(processed);
        cv::Mat decoded = ImageEncoder::decode(bytes);
        check(ImageEncoder::validateImage(decoded, expected),
              "zoom " + std::to_string(zoom) + " encoded payload decodes to the same size");
    }
}

static void testZoomValidation() {
    std::cout << "\n=== Zoom validation ===\n";

    ImageSynthesizer synthesizer;
    ArrowSequence sequence = sequenceFromString("000000");
    std::mt19937 rng(1);

    for (int zoom : {0, 5, -1}) {
        bool thrown = false;
        try {
            synthesizer.render(sequence, zoom, rng);
        } catch (const InvalidArgument&) {
            thrown = true;
        }
        check(thrown, "zoom " + std::to_string(zoom) + " rejected with InvalidArgument");
    }

    bool short_sequence_rejected = false;
    try {
        synthesizer.render(ArrowSequence(5, ArrowDirection::UP), 1, rng);
    } catch (const InvalidArgument&) {
        short_sequence_rejected = true;
    }
    check(short_sequence_rejected, "sequence of 5 arrows rejected");
}

static void testDeterminism() {
    std::cout << "\n=== Seeded rendering ===\n";

    ImageSynthesizer synthesizer;
    ArrowSequence sequence = sequenceFromString("120210");

    std::mt19937 rng_a(2024);
    std::mt19937 rng_b(2024);
    std::mt19937 rng_c(2025);
    cv::Mat a = synthesizer.render(sequence, 2, rng_a);
    cv::Mat b = synthesizer.render(sequence, 2, rng_b);
    cv::Mat c = synthesizer.render(sequence, 2, rng_c);

    check(sameImage(a, b), "same seed renders the same pixels");
    check(!sameImage(a, c), "different seed renders different pixels");
}

static void testGeometry() {
    std::cout << "\n=== Badge and arrow geometry ===\n";

    for (int zoom = 1; zoom <= 4; ++zoom) {
        std::vector<cv::Point> centers = ImageSynthesizer::badgeCenters(zoom);
        int radius = ImageSynthesizer::CIRCLE_SIZE * zoom / 2;
        int left_margin = centers.front().x - radius;
        int right_margin = 180 * zoom - (centers.back().x + radius);
        int gap = centers[1].x - centers[0].x - 2 * radius;

        check(centers.size() == 6, "zoom " + std::to_string(zoom) + " has six badges");
        check(std::abs(left_margin - right_margin) <= 1, "zoom " + std::to_string(zoom) + " badges are centered");
        check(gap == 2 * zoom, "zoom " + std::to_string(zoom) + " badges are 2*zoom apart");
    }

    cv::Point center(100, 50);
    auto left = ImageSynthesizer::arrowPolygon(center, ArrowDirection::LEFT, 2);
    auto up = ImageSynthesizer::arrowPolygon(center, ArrowDirection::UP, 2);
    auto right = ImageSynthesizer::arrowPolygon(center, ArrowDirection::RIGHT, 2);

    check(left.size() == 7 && up.size() == 7 && right.size() == 7, "arrows are seven-point polygons");
    check(left[0].x < center.x && left[0].y == center.y, "left arrow tip points left");
    check(right[0].x > center.x && right[0].y == center.y, "right arrow tip points right");
    check(up[0].y < center.y && up[0].x == center.x, "up arrow tip points up");

    cv::Rect bounds = cv::boundingRect(up);
    check(bounds.width <= 16 * 2 + 1 && bounds.height <= 16 * 2 + 1, "arrow fits inside its glyph size");
}

static void testPixelate() {
    std::cout << "\n=== Pixelation ===\n";

    cv::Mat source = randomImage(31, 17, 7);
    cv::Mat pixelated = PostProcessor::pixelate(source, 4);

    bool blocks_uniform = true;
    for (int y = 0; y < source.rows; ++y) {
        for (int x = 0; x < source.cols; ++x) {
            cv::Vec3b expected = source.at<cv::Vec3b>(y - y % 4, x - x % 4);
            if (pixelated.at<cv::Vec3b>(y, x) != expected) {
                blocks_uniform = false;
            }
        }
    }
    check(blocks_uniform, "each 4x4 block takes its top-left color, partial edge blocks included");
    check(sameImage(PostProcessor::pixelate(source, 1), source), "block size 1 is the identity");
    check(PostProcessor::pixelBlockSize(1) == 1 && PostProcessor::pixelBlockSize(4) == 1 &&
          PostProcessor::pixelBlockSize(8) == 2, "block side is max(1, zoom/4)");
}

static void testBoxBlur() {
    std::cout << "\n=== Box blur ===\n";

    cv::Mat flat(20, 30, CV_8UC3, cv::Scalar(100, 100, 100));
    cv::Mat full = PostProcessor::boxBlur(flat, 3, 1.0);
    check(sameImage(full, flat), "weights summing to 1 keep a flat image flat");

    cv::Mat half = PostProcessor::boxBlur(flat, 3, 0.5);
    cv::Vec3b interior = half.at<cv::Vec3b>(10, 15);
    cv::Vec3b corner = half.at<cv::Vec3b>(0, 0);
    check(interior[0] == 50 && interior[2] == 50, "interior pixels scale by the kernel strength");
    check(corner[0] == 100, "edge pixels keep their value");

    cv::Mat source = randomImage(25, 15, 11);
    cv::Mat blurred = PostProcessor::boxBlur(source, 3, 0.7);
    bool edges_untouched = true;
    for (int x = 0; x < source.cols; ++x) {
        edges_untouched &= blurred.at<cv::Vec3b>(0, x) == source.at<cv::Vec3b>(0, x);
        edges_untouched &= blurred.at<cv::Vec3b>(source.rows - 1, x) == source.at<cv::Vec3b>(source.rows - 1, x);
    }
    for (int y = 0; y < source.rows; ++y) {
        edges_untouched &= blurred.at<cv::Vec3b>(y, 0) == source.at<cv::Vec3b>(y, 0);
        edges_untouched &= blurred.at<cv::Vec3b>(y, source.cols - 1) == source.at<cv::Vec3b>(y, source.cols - 1);
    }
    check(edges_untouched, "no wraparound or extension at the border");
    check(std::abs(PostProcessor::blurStrength(3) - 0.6) < 1e-9, "strength is 0.3 + 0.1*zoom");
}

static void testPostProcessorPassThrough() {
    std::cout << "\n=== Post-processing by zoom ===\n";

    PostProcessor post_processor;
    cv::Mat source = randomImage(180, 35, 3);
    check(sameImage(post_processor.apply(source, 1), source), "zoom 1 passes through unchanged");

    cv::Mat zoom4 = randomImage(720, 140, 5);
    check(post_processor.apply(zoom4, 4).size() == zoom4.size(), "zoom 4 keeps dimensions");
}

static void testEncoder() {
    std::cout << "\n=== Encoder ===\n";

    cv::Mat source = randomImage(60, 20, 13);

    ImageEncoder png("png", 0.8);
    std::vector<uchar> png_bytes = png.encode(source);
    check(png_bytes.size() > 8 && png_bytes[0] == 0x89 && png_bytes[1] == 'P', "png payload has PNG signature");
    check(sameImage(ImageEncoder::decode(png_bytes), source), "png is lossless");
    check(png.contentType() == "image/png", "png content type");

    ImageEncoder jpeg("jpg", 0.8);
    std::vector<uchar> jpeg_bytes = jpeg.encode(source);
    check(jpeg.format() == "jpeg", "jpg alias normalised");
    check(jpeg_bytes.size() > 2 && jpeg_bytes[0] == 0xFF && jpeg_bytes[1] == 0xD8, "jpeg payload has SOI marker");
    check(jpeg.contentType() == "image/jpeg", "jpeg content type");

    bool rejected = false;
    try {
        ImageEncoder gif("gif", 0.8);
    } catch (const EncodingError&) {
        rejected = true;
    }
    check(rejected, "unsupported format raises EncodingError");

    bool empty_rejected = false;
    try {
        png.encode(cv::Mat());
    } catch (const EncodingError&) {
        empty_rejected = true;
    }
    check(empty_rejected, "empty canvas raises EncodingError");
    check(ImageEncoder::decode({}).empty(), "empty payload decodes to nothing");
}

int main() {
    std::cout << "=== Testing Captcha Image Pipeline ===\n";

    try {
        testDimensions();
        testZoomValidation();
        testDeterminism();
        testGeometry();
        testPixelate();
        testBoxBlur();
        testPostProcessorPassThrough();
        testEncoder();
    } catch (const std::exception& e) {
        std::cout << "  ❌ FAILED: unexpected exception: " << e.what() << std::endl;
        failures++;
    }

    std::cout << "\n=== Test completed: " << failures << " failure(s) ===\n";
    return failures == 0 ? 0 : 1;
}
