#include "image_synthesizer.hpp"
#include "captcha_errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace {

const cv::Scalar BACKGROUND_COLOR(250, 250, 250);
const cv::Scalar NOISE_TEXT_COLOR(192, 192, 192);

// Arrow fills (BGR)
const cv::Scalar BRIGHT_COLORS[] = {
    cv::Scalar(0, 0, 255),      // red
    cv::Scalar(255, 0, 0),      // blue
    cv::Scalar(0, 255, 0),      // green
    cv::Scalar(255, 0, 255),    // magenta
    cv::Scalar(255, 255, 0),    // cyan
    cv::Scalar(0, 200, 255),    // orange
    cv::Scalar(180, 105, 255),  // pink
    cv::Scalar(128, 0, 128),    // purple
    cv::Scalar(0, 165, 255)     // amber
};

// Noise line colors (BGR)
const cv::Scalar BOLD_COLORS[] = {
    cv::Scalar(0, 0, 255),
    cv::Scalar(0, 0, 0),
    cv::Scalar(255, 255, 255),
    cv::Scalar(255, 0, 0),
    cv::Scalar(0, 255, 0),
    cv::Scalar(128, 0, 128),
    cv::Scalar(0, 165, 255)
};

const std::string NOISE_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789!@#$%^&*()";

constexpr double SHADOW_ALPHA = 60.0 / 255.0;
constexpr double NOISE_TEXT_OPACITY = 0.3;
constexpr double WAVE_ALPHA = 80.0 / 255.0;
constexpr int NOISE_MAX_ROTATION = 15;
constexpr int WAVE_COUNT = 3;
constexpr int DOTS_PER_ZOOM = 30;
constexpr int NOISE_FONT = cv::FONT_HERSHEY_SIMPLEX;

int randInt(std::mt19937& rng, int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

template <typename T, size_t N>
const T& pick(const T (&palette)[N], std::mt19937& rng) {
    return palette[randInt(rng, 0, static_cast<int>(N) - 1)];
}

cv::Scalar randomColor(std::mt19937& rng) {
    return cv::Scalar(randInt(rng, 0, 255), randInt(rng, 0, 255), randInt(rng, 0, 255));
}

cv::Scalar randomGray(std::mt19937& rng, int base, int range) {
    return cv::Scalar(base + randInt(rng, 0, range - 1),
                      base + randInt(rng, 0, range - 1),
                      base + randInt(rng, 0, range - 1));
}

// Same rule as a "brighter" color in most 2D toolkits: scale up by 1/0.7,
// lifting near-black channels first so black does not stay black.
cv::Scalar brighter(const cv::Scalar& color) {
    constexpr double factor = 0.7;
    constexpr int floor_value = static_cast<int>(1.0 / (1.0 - factor));

    if (color[0] == 0 && color[1] == 0 && color[2] == 0) {
        return cv::Scalar(floor_value, floor_value, floor_value);
    }

    cv::Scalar result;
    for (int c = 0; c < 3; ++c) {
        double value = color[c];
        if (value > 0 && value < floor_value) value = floor_value;
        result[c] = std::min(255.0, std::floor(value / factor));
    }
    return result;
}

cv::Rect clipToCanvas(const cv::Rect& area, const cv::Mat& canvas) {
    return area & cv::Rect(0, 0, canvas.cols, canvas.rows);
}

// Paint into a copy of the region, then mix it back with the given alpha.
template <typename DrawFn>
void drawTranslucent(cv::Mat& canvas, const cv::Rect& area, double alpha, DrawFn draw) {
    cv::Rect region = clipToCanvas(area, canvas);
    if (region.width <= 0 || region.height <= 0) {
        return;
    }

    cv::Mat target = canvas(region);
    cv::Mat overlay = target.clone();
    draw(overlay, region.tl());
    cv::addWeighted(overlay, alpha, target, 1.0 - alpha, 0.0, target);
}

// Composite a colored patch through an 8-bit coverage mask
void blendPatch(cv::Mat& canvas, const cv::Mat& patch, const cv::Mat& mask,
                const cv::Point& top_left, double opacity) {
    cv::Rect visible = clipToCanvas(cv::Rect(top_left, mask.size()), canvas);
    if (visible.width <= 0 || visible.height <= 0) {
        return;
    }

    for (int y = visible.y; y < visible.y + visible.height; ++y) {
        cv::Vec3b* row = canvas.ptr<cv::Vec3b>(y);
        const uchar* mask_row = mask.ptr<uchar>(y - top_left.y);
        const cv::Vec3b* patch_row = patch.ptr<cv::Vec3b>(y - top_left.y);

        for (int x = visible.x; x < visible.x + visible.width; ++x) {
            uchar coverage = mask_row[x - top_left.x];
            if (coverage == 0) {
                continue;
            }
            double a = opacity * coverage / 255.0;
            const cv::Vec3b& src = patch_row[x - top_left.x];
            for (int c = 0; c < 3; ++c) {
                row[x][c] = cv::saturate_cast<uchar>(row[x][c] * (1.0 - a) + src[c] * a);
            }
        }
    }
}

} // namespace

void ImageSynthesizer::validateZoom(int zoom) {
    if (zoom < MIN_ZOOM || zoom > MAX_ZOOM) {
        throw InvalidArgument("Zoom level must be between 1 and 4, got " + std::to_string(zoom));
    }
}

cv::Size ImageSynthesizer::canvasSize(int zoom) {
    validateZoom(zoom);
    return cv::Size(BASE_WIDTH * zoom, BASE_HEIGHT * zoom);
}

cv::Mat ImageSynthesizer::render(const ArrowSequence& sequence, int zoom, std::mt19937& rng) const {
    cv::Size size = canvasSize(zoom);
    if (static_cast<int>(sequence.size()) != SEQUENCE_LENGTH) {
        throw InvalidArgument("Arrow sequence must have exactly 6 symbols");
    }

    cv::Mat canvas(size, CV_8UC3, BACKGROUND_COLOR);

    drawBackground(canvas, zoom, rng);
    drawBadges(canvas, sequence, zoom, rng);
    drawNoiseCharacters(canvas, zoom, rng);
    drawNoiseLines(canvas, zoom, rng);
    drawDistortionEffects(canvas, zoom, rng);

    return canvas;
}

void ImageSynthesizer::drawBackground(cv::Mat& canvas, int zoom, std::mt19937& rng) const {
    canvas.setTo(BACKGROUND_COLOR);

    // Roughly one light speckle per 50 pixels
    int speckles = canvas.cols * canvas.rows / 50;
    for (int i = 0; i < speckles; ++i) {
        int x = randInt(rng, 0, canvas.cols - 1);
        int y = randInt(rng, 0, canvas.rows - 1);
        int brightness = randInt(rng, 220, 254);
        cv::rectangle(canvas, clipToCanvas(cv::Rect(x, y, zoom, zoom), canvas),
                      cv::Scalar(brightness, brightness, brightness), cv::FILLED);
    }
}

std::vector<cv::Point> ImageSynthesizer::badgeCenters(int zoom) {
    cv::Size size = canvasSize(zoom);
    int circle_size = CIRCLE_SIZE * zoom;
    int spacing = ARROW_SPACING * zoom;
    int total_width = SEQUENCE_LENGTH * circle_size + (SEQUENCE_LENGTH - 1) * spacing;
    int start_x = (size.width - total_width) / 2 + circle_size / 2;
    int center_y = size.height / 2;

    std::vector<cv::Point> centers;
    centers.reserve(SEQUENCE_LENGTH);
    for (int i = 0; i < SEQUENCE_LENGTH; ++i) {
        centers.emplace_back(start_x + i * (circle_size + spacing), center_y);
    }
    return centers;
}

void ImageSynthesizer::drawBadges(cv::Mat& canvas, const ArrowSequence& sequence,
                                  int zoom, std::mt19937& rng) const {
    std::vector<cv::Point> centers = badgeCenters(zoom);
    for (size_t i = 0; i < centers.size(); ++i) {
        drawBadge(canvas, centers[i], zoom, rng);
        drawArrow(canvas, centers[i], sequence[i], zoom, rng);
    }
}

void ImageSynthesizer::drawBadge(cv::Mat& canvas, const cv::Point& center,
                                 int zoom, std::mt19937& rng) const {
    int size = CIRCLE_SIZE * zoom;
    int radius = size / 2;

    // Drop shadow, offset by half the radius
    cv::Scalar shadow_color = randomGray(rng, 180, 50);
    cv::Point shadow_center = center + cv::Point(radius / 2, radius / 2);
    cv::Rect shadow_box(shadow_center.x - radius - 1, shadow_center.y - radius - 1, size + 3, size + 3);
    drawTranslucent(canvas, shadow_box, SHADOW_ALPHA,
        [&](cv::Mat& overlay, const cv::Point& offset) {
            cv::circle(overlay, shadow_center - offset, radius, shadow_color, cv::FILLED, cv::LINE_AA);
        });

    // Diagonal gradient between two near-gray tones
    cv::Scalar from = randomGray(rng, 230, 25);
    cv::Scalar to = randomGray(rng, 200, 55);
    cv::Rect box(center.x - radius - 1, center.y - radius - 1, size + 3, size + 3);

    cv::Mat mask = cv::Mat::zeros(box.size(), CV_8U);
    cv::circle(mask, center - box.tl(), radius, cv::Scalar(255), cv::FILLED, cv::LINE_AA);

    cv::Mat gradient(box.size(), CV_8UC3);
    double span = std::max(1, box.width + box.height - 2);
    for (int y = 0; y < gradient.rows; ++y) {
        cv::Vec3b* row = gradient.ptr<cv::Vec3b>(y);
        for (int x = 0; x < gradient.cols; ++x) {
            double t = (x + y) / span;
            for (int c = 0; c < 3; ++c) {
                row[x][c] = cv::saturate_cast<uchar>(from[c] * (1.0 - t) + to[c] * t);
            }
        }
    }
    blendPatch(canvas, gradient, mask, box.tl(), 1.0);

    cv::Scalar border_color = randomGray(rng, 150, 80);
    cv::circle(canvas, center, radius, border_color, std::max(1, zoom / 2), cv::LINE_AA);
}

std::vector<cv::Point> ImageSynthesizer::arrowPolygon(const cv::Point& center, ArrowDirection direction, int zoom) {
    int s = ARROW_SIZE * zoom;
    int cx = center.x;
    int cy = center.y;

    switch (direction) {
        case ArrowDirection::UP:
            return {
                {cx, cy - s / 3},
                {cx - s / 2, cy + s / 6},
                {cx - s / 4, cy + s / 6},
                {cx - s / 4, cy + s / 3},
                {cx + s / 4, cy + s / 3},
                {cx + s / 4, cy + s / 6},
                {cx + s / 2, cy + s / 6}
            };
        case ArrowDirection::LEFT:
            return {
                {cx - s / 3, cy},
                {cx + s / 6, cy - s / 2},
                {cx + s / 6, cy - s / 4},
                {cx + s / 3, cy - s / 4},
                {cx + s / 3, cy + s / 4},
                {cx + s / 6, cy + s / 4},
                {cx + s / 6, cy + s / 2}
            };
        case ArrowDirection::RIGHT:
            return {
                {cx + s / 3, cy},
                {cx - s / 6, cy - s / 2},
                {cx - s / 6, cy - s / 4},
                {cx - s / 3, cy - s / 4},
                {cx - s / 3, cy + s / 4},
                {cx - s / 6, cy + s / 4},
                {cx - s / 6, cy + s / 2}
            };
        default:
            throw InvalidArgument("Unknown arrow direction");
    }
}

void ImageSynthesizer::drawArrow(cv::Mat& canvas, const cv::Point& center, ArrowDirection direction,
                                 int zoom, std::mt19937& rng) const {
    const cv::Scalar& color = pick(BRIGHT_COLORS, rng);
    std::vector<std::vector<cv::Point>> contour{arrowPolygon(center, direction, zoom)};

    cv::fillPoly(canvas, contour, color, cv::LINE_AA);
    cv::polylines(canvas, contour, true, brighter(color), std::max(1, zoom / 2), cv::LINE_AA);
}

void ImageSynthesizer::drawNoiseCharacters(cv::Mat& canvas, int zoom, std::mt19937& rng) const {
    int thickness = std::max(1, zoom);

    // Scale the Hershey font so a capital letter is NOISE_FONT_SIZE * zoom pixels tall
    int baseline = 0;
    cv::Size unit = cv::getTextSize("M", NOISE_FONT, 1.0, thickness, &baseline);
    double scale = static_cast<double>(NOISE_FONT_SIZE * zoom) / std::max(1, unit.height);

    cv::Size m_size = cv::getTextSize("M", NOISE_FONT, scale, thickness, &baseline);
    int ascent = m_size.height;
    int line_height = std::max(1, m_size.height + baseline);
    int min_advance = std::max(1, m_size.width / 3);
    int num_rows = canvas.rows / line_height + 1;

    // Room for any glyph at any rotation around its baseline origin
    int pad = std::max(m_size.width, line_height) * 2;
    int patch_side = pad * 2;
    cv::Mat color_patch(patch_side, patch_side, CV_8UC3, NOISE_TEXT_COLOR);
    cv::Point2f origin(static_cast<float>(pad), static_cast<float>(pad));

    for (int row = 0; row < num_rows; ++row) {
        int y = row * line_height + ascent;
        int current_x = 0;

        while (current_x < canvas.cols) {
            std::string glyph(1, NOISE_CHARS[randInt(rng, 0, static_cast<int>(NOISE_CHARS.size()) - 1)]);
            int rotation = randInt(rng, -NOISE_MAX_ROTATION, NOISE_MAX_ROTATION);

            cv::Mat mask = cv::Mat::zeros(patch_side, patch_side, CV_8U);
            cv::putText(mask, glyph, cv::Point(pad, pad), NOISE_FONT, scale,
                        cv::Scalar(255), thickness, cv::LINE_AA);

            cv::Mat rotated;
            cv::Mat transform = cv::getRotationMatrix2D(origin, static_cast<double>(rotation), 1.0);
            cv::warpAffine(mask, rotated, transform, mask.size(), cv::INTER_LINEAR,
                           cv::BORDER_CONSTANT, cv::Scalar(0));

            blendPatch(canvas, color_patch, rotated, cv::Point(current_x - pad, y - pad), NOISE_TEXT_OPACITY);

            cv::Size glyph_size = cv::getTextSize(glyph, NOISE_FONT, scale, thickness, &baseline);
            current_x += std::max(glyph_size.width / 2, min_advance);
        }
    }
}

void ImageSynthesizer::drawNoiseLines(cv::Mat& canvas, int zoom, std::mt19937& rng) const {
    int width = canvas.cols;
    int height = canvas.rows;
    int num_lines = randInt(rng, 3, std::max(3, 2 + zoom));
    int thickness = 1 + (zoom > 2 ? 1 : 0);

    for (int i = 0; i < num_lines; ++i) {
        const cv::Scalar& color = pick(BOLD_COLORS, rng);
        cv::Point from;
        cv::Point to;

        switch (randInt(rng, 0, 3)) {
            case 0: {
                int y = randInt(rng, 0, height - 1);
                from = cv::Point(0, y);
                to = cv::Point(width - 1, y);
                break;
            }
            case 1: {
                int x = randInt(rng, 0, width - 1);
                from = cv::Point(x, 0);
                to = cv::Point(x, height - 1);
                break;
            }
            case 2:
                from = cv::Point(0, randInt(rng, 0, height - 1));
                to = cv::Point(width - 1, randInt(rng, 0, height - 1));
                break;
            default:
                from = cv::Point(width - 1, randInt(rng, 0, height - 1));
                to = cv::Point(0, randInt(rng, 0, height - 1));
                break;
        }

        cv::line(canvas, from, to, color, thickness, cv::LINE_AA);
    }
}

void ImageSynthesizer::drawDistortionEffects(cv::Mat& canvas, int zoom, std::mt19937& rng) const {
    int width = canvas.cols;
    int height = canvas.rows;
    int wave_thickness = std::max(1, cvRound(0.8 * zoom));
    std::uniform_real_distribution<double> phase_dist(0.0, 2.0 * CV_PI);

    for (int i = 0; i < WAVE_COUNT; ++i) {
        cv::Scalar color = randomColor(rng);
        int start_y = randInt(rng, 0, height - 1);
        int amplitude = randInt(rng, 5, 14) * zoom;
        int period = randInt(rng, 20, 39) * zoom;
        double phase = phase_dist(rng);

        std::vector<std::vector<cv::Point>> curve(1);
        curve[0].reserve(width);
        for (int x = 0; x < width; ++x) {
            int y = start_y + static_cast<int>(amplitude * std::sin(2.0 * CV_PI * x / period + phase));
            curve[0].emplace_back(x, y);
        }

        drawTranslucent(canvas, cv::Rect(0, 0, width, height), WAVE_ALPHA,
            [&](cv::Mat& overlay, const cv::Point&) {
                cv::polylines(overlay, curve, false, color, wave_thickness, cv::LINE_AA);
            });
    }

    int num_dots = DOTS_PER_ZOOM * zoom;
    for (int i = 0; i < num_dots; ++i) {
        cv::Scalar color = randomColor(rng);
        double alpha = randInt(rng, 60, 159) / 255.0;
        int x = randInt(rng, 0, width - 1);
        int y = randInt(rng, 0, height - 1);
        int size = randInt(rng, 1, 3) * zoom;
        int radius = std::max(1, size / 2);
        cv::Point center(x + size / 2, y + size / 2);

        drawTranslucent(canvas, cv::Rect(center.x - radius - 1, center.y - radius - 1,
                                         2 * radius + 3, 2 * radius + 3), alpha,
            [&](cv::Mat& overlay, const cv::Point& offset) {
                cv::circle(overlay, center - offset, radius, color, cv::FILLED, cv::LINE_AA);
            });
    }
}
