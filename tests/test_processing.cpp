#include "monodither/image/processing.hpp"
#include "monodither/core/errors.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>

namespace image = monodither::image;
using monodither::test::is_binary_gray;
using monodither::test::make_noise_bgr;

TEST_CASE("target_size_downscales_longest_side_to_limit") {
    REQUIRE(image::compute_target_size(1600, 900, 800) == cv::Size(800, 450));
    REQUIRE(image::compute_target_size(900, 1600, 800) == cv::Size(450, 800));
    REQUIRE(image::compute_target_size(1000, 333, 800) == cv::Size(800, 266));
}

TEST_CASE("target_size_never_upscales") {
    REQUIRE(image::compute_target_size(300, 200, 800) == cv::Size(300, 200));
    REQUIRE(image::compute_target_size(800, 800, 800) == cv::Size(800, 800));
    REQUIRE(image::compute_target_size(1, 1, 800) == cv::Size(1, 1));
}

TEST_CASE("target_size_keeps_each_side_at_least_one") {
    REQUIRE(image::compute_target_size(1, 5000, 800) == cv::Size(1, 800));
    REQUIRE(image::compute_target_size(5000, 2, 100) == cv::Size(100, 1));
}

TEST_CASE("target_size_rejects_degenerate_input") {
    REQUIRE_THROWS_AS(image::compute_target_size(0, 10, 800), monodither::ValidationError);
    REQUIRE_THROWS_AS(image::compute_target_size(10, 10, 0), monodither::ValidationError);
}

TEST_CASE("resize_lanczos_produces_requested_size") {
    cv::Mat src = make_noise_bgr(640, 480);
    cv::Mat out = image::resize_lanczos(src, cv::Size(320, 240));
    REQUIRE(out.cols == 320);
    REQUIRE(out.rows == 240);
    REQUIRE(out.type() == CV_8UC3);
}

TEST_CASE("resize_lanczos_same_size_is_an_exact_copy") {
    cv::Mat src = make_noise_bgr(64, 32);
    cv::Mat out = image::resize_lanczos(src, src.size());
    REQUIRE(out.data != src.data);
    REQUIRE(cv::countNonZero(out.reshape(1) != src.reshape(1)) == 0);
}

TEST_CASE("luminance_uses_bt601_weights_and_truncates") {
    cv::Mat bgr(1, 5, CV_8UC3);
    bgr.at<cv::Vec3b>(0, 0) = cv::Vec3b(0, 0, 255);     // red
    bgr.at<cv::Vec3b>(0, 1) = cv::Vec3b(0, 255, 0);     // green
    bgr.at<cv::Vec3b>(0, 2) = cv::Vec3b(255, 0, 0);     // blue
    bgr.at<cv::Vec3b>(0, 3) = cv::Vec3b(0, 0, 0);
    bgr.at<cv::Vec3b>(0, 4) = cv::Vec3b(10, 20, 30);    // 8.97 + 11.74 + 1.14

    cv::Mat gray = image::luminance_bt601(bgr);
    REQUIRE(gray.type() == CV_8UC1);
    REQUIRE(gray.at<uint8_t>(0, 0) == 76);
    REQUIRE(gray.at<uint8_t>(0, 1) == 149);
    REQUIRE(gray.at<uint8_t>(0, 2) == 29);
    REQUIRE(gray.at<uint8_t>(0, 3) == 0);
    REQUIRE(gray.at<uint8_t>(0, 4) == 21);
}

TEST_CASE("luminance_ignores_alpha") {
    cv::Mat bgra(1, 2, CV_8UC4);
    bgra.at<cv::Vec4b>(0, 0) = cv::Vec4b(0, 0, 255, 0);
    bgra.at<cv::Vec4b>(0, 1) = cv::Vec4b(0, 0, 255, 255);

    cv::Mat gray = image::luminance_bt601(bgra);
    REQUIRE(gray.at<uint8_t>(0, 0) == 76);
    REQUIRE(gray.at<uint8_t>(0, 1) == 76);
}

TEST_CASE("ordered_dither_on_uniform_gray_is_a_per_cell_threshold_test") {
    const auto m = image::generate_bayer_matrix(8);
    const int g = 100;
    cv::Mat gray(16, 24, CV_8UC1, cv::Scalar(g));

    cv::Mat out = image::ordered_dither(gray, m);
    REQUIRE(is_binary_gray(out));

    int white = 0;
    for (int y = 0; y < out.rows; ++y) {
        for (int x = 0; x < out.cols; ++x) {
            const uint8_t expected = (m.threshold(y, x) < g) ? 255 : 0;
            REQUIRE(out.at<uint8_t>(y, x) == expected);
            if (out.at<uint8_t>(y, x) == 255)
                ++white;
        }
    }
    // ranks 1..24 have thresholds below 100; six 8x8 tiles
    REQUIRE(white == 24 * 6);
}

TEST_CASE("ordered_dither_extremes") {
    const auto m = image::generate_bayer_matrix(8);

    cv::Mat black(8, 8, CV_8UC1, cv::Scalar(0));
    REQUIRE(cv::countNonZero(image::ordered_dither(black, m)) == 0);

    // the highest rank maps to 256, which no 8-bit value exceeds
    cv::Mat white(8, 8, CV_8UC1, cv::Scalar(255));
    REQUIRE(cv::countNonZero(image::ordered_dither(white, m)) == 63);
}

TEST_CASE("ordered_dither_order_32_whitens_every_non_black_pixel") {
    const auto m = image::generate_bayer_matrix(32);

    cv::Mat gray(40, 70, CV_8UC1);
    for (int y = 0; y < gray.rows; ++y) {
        for (int x = 0; x < gray.cols; ++x) {
            gray.at<uint8_t>(y, x) = static_cast<uint8_t>((x * 7 + y * 3) % 4 == 0 ? 0 : (x + y) % 256);
        }
    }
    gray.at<uint8_t>(3, 5) = 1;

    cv::Mat out = image::ordered_dither(gray, m);
    for (int y = 0; y < gray.rows; ++y) {
        for (int x = 0; x < gray.cols; ++x) {
            const uint8_t expected = gray.at<uint8_t>(y, x) > 0 ? 255 : 0;
            REQUIRE(out.at<uint8_t>(y, x) == expected);
        }
    }
}

TEST_CASE("ordered_dither_rejects_color_input") {
    const auto m = image::generate_bayer_matrix(4);
    REQUIRE_THROWS_AS(image::ordered_dither(make_noise_bgr(4, 4), m),
                      monodither::ValidationError);
}

TEST_CASE("dither_image_downscales_and_binarizes") {
    const auto m = image::generate_bayer_matrix(8);
    monodither::config::DitherConfig cfg;
    cfg.max_image_side = 800;

    cv::Mat out = image::dither_image(make_noise_bgr(1200, 600), m, cfg);
    REQUIRE(out.cols == 800);
    REQUIRE(out.rows == 400);
    REQUIRE(is_binary_gray(out));
}

TEST_CASE("dither_image_keeps_small_images_at_native_size") {
    const auto m = image::generate_bayer_matrix(4);
    monodither::config::DitherConfig cfg;

    cv::Mat out = image::dither_image(make_noise_bgr(300, 200), m, cfg);
    REQUIRE(out.cols == 300);
    REQUIRE(out.rows == 200);
    REQUIRE(is_binary_gray(out));
}

TEST_CASE("dither_image_rejects_empty_input") {
    const auto m = image::generate_bayer_matrix(8);
    REQUIRE_THROWS_AS(image::dither_image(cv::Mat(), m, {}), monodither::ValidationError);
}
