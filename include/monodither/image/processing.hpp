#pragma once

#include "monodither/config/configuration.hpp"
#include "monodither/image/bayer_matrix.hpp"

#include <opencv2/core.hpp>

namespace monodither::image {

// Aspect-preserving size that fits max_image_side. Never upscales; each
// dimension is at least 1.
cv::Size compute_target_size(int width, int height, int max_image_side);

// Lanczos resample of a BGR(A) image. Returns a copy when the size is unchanged.
cv::Mat resize_lanczos(const cv::Mat& src, const cv::Size& size);

// ITU-R BT.601 luma of an 8-bit BGR or BGRA image, truncated to CV_8UC1.
// Alpha is ignored.
cv::Mat luminance_bt601(const cv::Mat& bgr);

// Binary threshold against the tiled Bayer matrix: 255 where
// gray > threshold(y, x), else 0.
cv::Mat ordered_dither(const cv::Mat& gray, const BayerMatrix& matrix);

// resize -> luminance -> ordered dither
cv::Mat dither_image(const cv::Mat& src, const BayerMatrix& matrix,
                     const config::DitherConfig& cfg);

} // namespace monodither::image
