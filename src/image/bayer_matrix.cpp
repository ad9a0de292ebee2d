#include "monodither/image/bayer_matrix.hpp"
#include "monodither/core/errors.hpp"
#include "monodither/core/utils.hpp"

#include <string>
#include <utility>

namespace monodither::image {

BayerMatrix::BayerMatrix(Matrix2Di ranks)
    : ranks_(std::move(ranks)),
      order_(static_cast<int>(ranks_.rows())),
      scale_(0) {
    if (ranks_.rows() != ranks_.cols() || !core::is_power_of_two(order_) ||
        order_ > kMaxBayerOrder) {
        throw ValidationError("Bayer matrix must be square with power-of-2 side");
    }
    scale_ = 256 / (order_ * order_);
}

BayerMatrix generate_bayer_matrix(int order) {
    if (!core::is_power_of_two(order)) {
        throw ValidationError("Bayer order must be a power of 2 (got " +
                              std::to_string(order) + ")");
    }
    if (order > kMaxBayerOrder) {
        throw ValidationError("Bayer order too large (got " + std::to_string(order) + ")");
    }

    Matrix2Di m = Matrix2Di::Zero(order, order);
    int* data = m.data();
    const int stride = order;

    int size = 1;
    while (size < order) {
        for (int i = 0; i < size; ++i) {
            for (int j = 0; j < size; ++j) {
                const int v = data[i * stride + j];
                data[i * stride + j] = 4 * v + 1;
                data[i * stride + (j + size)] = 4 * v + 3;
                data[(i + size) * stride + j] = 4 * v + 2;
                data[(i + size) * stride + (j + size)] = 4 * v;
            }
        }
        size *= 2;
    }

    // Ranks start at 1
    m.array() += 1;

    return BayerMatrix(std::move(m));
}

} // namespace monodither::image
