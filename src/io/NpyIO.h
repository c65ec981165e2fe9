#pragma once

#include "audio/FeatureMatrix.h"

#include <filesystem>
#include <string>

namespace StemPrep {

// Write a matrix as a NumPy .npy file (format 1.0, '<f4', C order, shape (rows, cols)).
// Existing files are overwritten. Throws IOError on failure.
void writeNpy(const std::filesystem::path& path, const FeatureMatrix& matrix);

// Read a .npy file written by writeNpy (or numpy.save of a float32/float64
// C-order 1-D or 2-D array). 1-D arrays load as a single row.
// Throws IOError if the file is missing, truncated or of an unsupported layout.
FeatureMatrix readNpy(const std::filesystem::path& path);

// Header dictionary text for the given shape, padded so the data is 64-byte aligned.
std::string npyHeader(size_t rows, size_t cols);

} // namespace StemPrep
