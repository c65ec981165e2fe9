#pragma once

#include <cstddef>
#include <vector>

namespace StemPrep {

// Dense 2-D float array, row-major (C order).
// For MFCC output: rows = cepstral coefficients, cols = time frames.
struct FeatureMatrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<float> data;

    FeatureMatrix() = default;
    FeatureMatrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0f) {}

    float& at(size_t r, size_t c) { return data[r * cols + c]; }
    float at(size_t r, size_t c) const { return data[r * cols + c]; }

    bool empty() const { return data.empty(); }
};

} // namespace StemPrep
