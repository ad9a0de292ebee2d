#include "monodither/image/processing.hpp"
#include "monodither/core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

namespace monodither::image {

static void require_color_8u(const cv::Mat& img, const char* where) {
    if (img.empty()) {
        throw ValidationError(std::string(where) + ": input empty");
    }
    if (img.depth() != CV_8U || (img.channels() != 3 && img.channels() != 4)) {
        throw ValidationError(std::string(where) + ": expected CV_8UC3 or CV_8UC4");
    }
}

cv::Size compute_target_size(int width, int height, int max_image_side) {
    if (width < 1 || height < 1) {
        throw ValidationError("compute_target_size: image dimensions must be >= 1");
    }
    if (max_image_side < 1) {
        throw ValidationError("compute_target_size: max_image_side must be >= 1");
    }

    const int max_side = std::max(width, height);
    const double scale = (max_side > max_image_side)
                             ? static_cast<double>(max_image_side) / static_cast<double>(max_side)
                             : 1.0;

    const int new_w = static_cast<int>(std::lround(static_cast<double>(width) * scale));
    const int new_h = static_cast<int>(std::lround(static_cast<double>(height) * scale));
    return cv::Size(std::max(1, new_w), std::max(1, new_h));
}

cv::Mat resize_lanczos(const cv::Mat& src, const cv::Size& size) {
    require_color_8u(src, "resize_lanczos");

    if (src.size() == size) {
        return src.clone();
    }
    cv::Mat out;
    cv::resize(src, out, size, 0.0, 0.0, cv::INTER_LANCZOS4);
    return out;
}

cv::Mat luminance_bt601(const cv::Mat& bgr) {
    require_color_8u(bgr, "luminance_bt601");

    const int cn = bgr.channels();
    cv::Mat gray(bgr.rows, bgr.cols, CV_8UC1);

    for (int y = 0; y < bgr.rows; ++y) {
        const uint8_t* in_row = bgr.ptr<uint8_t>(y);
        uint8_t* out_row = gray.ptr<uint8_t>(y);

        for (int x = 0; x < bgr.cols; ++x) {
            const uint8_t* px = in_row + x * cn;
            const float b = static_cast<float>(px[0]);
            const float g = static_cast<float>(px[1]);
            const float r = static_cast<float>(px[2]);

            // single precision, truncated
            const float luma = r * 0.299f + g * 0.587f + b * 0.114f;
            const int v = static_cast<int>(luma);
            out_row[x] = static_cast<uint8_t>(std::min(v, 255));
        }
    }
    return gray;
}

cv::Mat ordered_dither(const cv::Mat& gray, const BayerMatrix& matrix) {
    if (gray.empty()) {
        throw ValidationError("ordered_dither: input empty");
    }
    if (gray.type() != CV_8UC1) {
        throw ValidationError("ordered_dither: expected CV_8UC1");
    }

    cv::Mat out(gray.rows, gray.cols, CV_8UC1);
    for (int y = 0; y < gray.rows; ++y) {
        const uint8_t* in_row = gray.ptr<uint8_t>(y);
        uint8_t* out_row = out.ptr<uint8_t>(y);

        for (int x = 0; x < gray.cols; ++x) {
            const int threshold = matrix.threshold(y, x);
            out_row[x] = (static_cast<int>(in_row[x]) > threshold) ? 255 : 0;
        }
    }
    return out;
}

cv::Mat dither_image(const cv::Mat& src, const BayerMatrix& matrix,
                     const config::DitherConfig& cfg) {
    require_color_8u(src, "dither_image");

    const cv::Size target = compute_target_size(src.cols, src.rows, cfg.max_image_side);
    cv::Mat resized = resize_lanczos(src, target);
    cv::Mat gray = luminance_bt601(resized);
    return ordered_dither(gray, matrix);
}

} // namespace monodither::image
