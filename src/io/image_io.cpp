#include "monodither/io/image_io.hpp"
#include "monodither/core/errors.hpp"
#include "monodither/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <limits>
#include <string>

namespace monodither::io {

cv::Mat decode_image(const std::vector<uint8_t>& bytes) {
    return decode_image(bytes.data(), bytes.size());
}

cv::Mat decode_image(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw DecodeError("empty input");
    }
    // cv::Mat dimensions are int
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw DecodeError("input too large (" + std::to_string(size) + " bytes)");
    }

    cv::Mat decoded;
    try {
        const cv::Mat buf(1, static_cast<int>(size), CV_8UC1, const_cast<uint8_t*>(data));
        decoded = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(e.what());
    }
    if (decoded.empty()) {
        throw DecodeError("unrecognized or corrupt image data");
    }

    if (decoded.depth() == CV_16U) {
        cv::Mat tmp;
        decoded.convertTo(tmp, CV_8U, 1.0 / 257.0);
        decoded = tmp;
    } else if (decoded.depth() != CV_8U) {
        throw DecodeError("unsupported sample depth");
    }

    switch (decoded.channels()) {
        case 1: {
            cv::Mat bgr;
            cv::cvtColor(decoded, bgr, cv::COLOR_GRAY2BGR);
            return bgr;
        }
        case 3:
        case 4:
            return decoded;
        default:
            throw DecodeError("unsupported channel count " +
                              std::to_string(decoded.channels()));
    }
}

cv::Mat read_image(const fs::path& path) {
    const std::vector<uint8_t> bytes = core::read_bytes(path);
    try {
        return decode_image(bytes);
    } catch (const DecodeError& e) {
        throw DecodeError(path.string() + ": " + e.what());
    }
}

std::vector<uint8_t> encode_image(const cv::Mat& gray, const std::string& format) {
    if (gray.empty() || gray.type() != CV_8UC1) {
        throw EncodeError("expected non-empty CV_8UC1 image");
    }

    const std::string fmt = core::to_lower(format);
    std::vector<int> params;
    if (fmt == "png") {
        params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    } else if (fmt == "tiff") {
        // 1 = no compression; always lossless
        params = {cv::IMWRITE_TIFF_COMPRESSION, 1};
    } else if (fmt != "bmp") {
        throw EncodeError("unsupported lossless format: " + format);
    }

    std::vector<uint8_t> out;
    bool ok = false;
    try {
        ok = cv::imencode("." + fmt, gray, out, params);
    } catch (const cv::Exception& e) {
        throw EncodeError(e.what());
    }
    if (!ok || out.empty()) {
        throw EncodeError("encoder returned no data for ." + fmt);
    }
    return out;
}

void write_image(const fs::path& path, const cv::Mat& gray, const std::string& format) {
    const std::vector<uint8_t> bytes = encode_image(gray, format);
    core::write_bytes(path, bytes);
}

} // namespace monodither::io
