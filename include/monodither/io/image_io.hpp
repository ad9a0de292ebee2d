#pragma once

#include "monodither/core/types.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace monodither::io {

// Decodes an encoded image into CV_8UC3 (BGR) or CV_8UC4 (BGRA).
// Grayscale inputs are expanded to BGR, 16-bit inputs reduced to 8-bit.
// Throws DecodeError.
cv::Mat decode_image(const std::vector<uint8_t>& bytes);
// Same over a raw buffer; sizes beyond INT_MAX are rejected before decoding.
cv::Mat decode_image(const uint8_t* data, size_t size);

// Reads and decodes a file; the format is sniffed from the content, not the
// extension. Throws IOError if unreadable, DecodeError if not an image.
cv::Mat read_image(const fs::path& path);

// Encodes a single-channel 8-bit image losslessly. format: png | bmp | tiff.
// Throws EncodeError.
std::vector<uint8_t> encode_image(const cv::Mat& gray, const std::string& format);

// Encodes and writes to path regardless of the path's extension.
void write_image(const fs::path& path, const cv::Mat& gray, const std::string& format);

} // namespace monodither::io
