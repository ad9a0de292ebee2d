#pragma once

#include "monodither/core/types.hpp"

namespace monodither::image {

// Largest order whose ranks (up to order^2) fit in an int
constexpr int kMaxBayerOrder = 1 << 15;

// Ordered-dither threshold matrix. Ranks are in [1, order^2], each unique.
// Immutable after construction, safe to share between threads.
class BayerMatrix {
public:
    explicit BayerMatrix(Matrix2Di ranks);

    int order() const { return order_; }

    // Rank at (row, col), both in [0, order)
    int rank(int row, int col) const { return ranks_(row, col); }

    // Threshold for pixel (y, x) with the matrix tiled over the image:
    // rank(y mod order, x mod order) * (256 / order^2), integer division.
    int threshold(int y, int x) const {
        return ranks_(y % order_, x % order_) * scale_;
    }

    // Integer step between consecutive ranks, 256 / order^2
    int scale() const { return scale_; }

    const Matrix2Di& ranks() const { return ranks_; }

private:
    Matrix2Di ranks_;
    int order_;
    int scale_;
};

// Builds the matrix by recursive quadrant doubling: each rank v of the
// size x size matrix expands to 4v+1 (top-left), 4v+3 (top-right),
// 4v+2 (bottom-left) and 4v (bottom-right). Throws ValidationError if
// order is not a power of two or exceeds kMaxBayerOrder.
BayerMatrix generate_bayer_matrix(int order);

} // namespace monodither::image
