#include "NpyIO.h"
#include "utils/Errors.h"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace StemPrep {

namespace {

const char kMagic[] = "\x93NUMPY";
constexpr size_t kMagicLen = 6;
constexpr size_t kArrayAlign = 64;

void putU32LE(std::vector<char>& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
}

uint32_t getU32LE(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t getU64LE(const unsigned char* p) {
    return static_cast<uint64_t>(getU32LE(p)) | (static_cast<uint64_t>(getU32LE(p + 4)) << 32);
}

// Value following "'key':" in the header dict, trimmed of leading spaces.
std::string headerValue(const std::string& header, const std::string& key) {
    const std::string token = "'" + key + "':";
    size_t pos = header.find(token);
    if (pos == std::string::npos) {
        return "";
    }
    pos += token.size();
    while (pos < header.size() && header[pos] == ' ') ++pos;
    return header.substr(pos);
}

std::vector<size_t> parseShape(const std::string& value, const std::string& path) {
    if (value.empty() || value[0] != '(') {
        throw IOError("Malformed shape in npy header: " + path);
    }
    size_t close = value.find(')');
    if (close == std::string::npos) {
        throw IOError("Malformed shape in npy header: " + path);
    }

    std::vector<size_t> dims;
    std::stringstream ss(value.substr(1, close - 1));
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t first = item.find_first_not_of(' ');
        if (first == std::string::npos) continue;
        try {
            dims.push_back(static_cast<size_t>(std::stoull(item.substr(first))));
        } catch (const std::exception&) {
            throw IOError("Malformed shape in npy header: " + path);
        }
    }
    return dims;
}

} // namespace

std::string npyHeader(size_t rows, size_t cols) {
    std::ostringstream dict;
    dict << "{'descr': '<f4', 'fortran_order': False, 'shape': (" << rows << ", " << cols << "), }";
    std::string header = dict.str();

    const size_t unpadded = kMagicLen + 2 + 2 + header.size() + 1;
    const size_t pad = (kArrayAlign - unpadded % kArrayAlign) % kArrayAlign;
    header.append(pad, ' ');
    header.push_back('\n');
    return header;
}

void writeNpy(const std::filesystem::path& path, const FeatureMatrix& matrix) {
    if (matrix.data.size() != matrix.rows * matrix.cols) {
        throw IOError("Matrix data does not match its shape for " + path.string());
    }

    const std::string header = npyHeader(matrix.rows, matrix.cols);
    if (header.size() > 0xFFFF) {
        throw IOError("npy header too long for " + path.string());
    }

    std::vector<char> payload;
    payload.reserve(matrix.data.size() * 4);
    for (float v : matrix.data) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        putU32LE(payload, bits);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Could not open " + path.string() + " for writing");
    }

    const uint16_t headerLen = static_cast<uint16_t>(header.size());
    const char version[2] = {1, 0};
    const char lenBytes[2] = {static_cast<char>(headerLen & 0xFF), static_cast<char>(headerLen >> 8)};

    out.write(kMagic, kMagicLen);
    out.write(version, 2);
    out.write(lenBytes, 2);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.flush();

    if (!out.good()) {
        throw IOError("Failed to write " + path.string());
    }
}

FeatureMatrix readNpy(const std::filesystem::path& path) {
    const std::string pathStr = path.string();
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("Could not open " + pathStr);
    }

    std::vector<unsigned char> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (data.size() < kMagicLen + 4 || std::memcmp(data.data(), kMagic, kMagicLen) != 0) {
        throw IOError("Not an npy file: " + pathStr);
    }

    const unsigned char major = data[kMagicLen];
    size_t headerLen = 0;
    size_t headerStart = 0;
    if (major == 1) {
        headerLen = static_cast<size_t>(data[kMagicLen + 2]) | (static_cast<size_t>(data[kMagicLen + 3]) << 8);
        headerStart = kMagicLen + 4;
    } else if (major == 2 || major == 3) {
        if (data.size() < kMagicLen + 6) {
            throw IOError("Truncated npy header: " + pathStr);
        }
        headerLen = getU32LE(data.data() + kMagicLen + 2);
        headerStart = kMagicLen + 6;
    } else {
        throw IOError("Unsupported npy version " + std::to_string(major) + ": " + pathStr);
    }

    if (data.size() < headerStart + headerLen) {
        throw IOError("Truncated npy header: " + pathStr);
    }
    const std::string header(reinterpret_cast<const char*>(data.data() + headerStart), headerLen);

    const std::string descr = headerValue(header, "descr");
    size_t itemSize = 0;
    if (descr.rfind("'<f4'", 0) == 0) {
        itemSize = 4;
    } else if (descr.rfind("'<f8'", 0) == 0) {
        itemSize = 8;
    } else {
        throw IOError("Unsupported npy dtype in " + pathStr);
    }

    if (headerValue(header, "fortran_order").rfind("False", 0) != 0) {
        throw IOError("Fortran-ordered npy arrays are not supported: " + pathStr);
    }

    const std::vector<size_t> dims = parseShape(headerValue(header, "shape"), pathStr);
    FeatureMatrix matrix;
    if (dims.size() == 2) {
        matrix = FeatureMatrix(dims[0], dims[1]);
    } else if (dims.size() == 1) {
        matrix = FeatureMatrix(1, dims[0]);
    } else {
        throw IOError("Only 1-D and 2-D npy arrays are supported: " + pathStr);
    }

    const size_t dataStart = headerStart + headerLen;
    const size_t count = matrix.rows * matrix.cols;
    if (data.size() - dataStart < count * itemSize) {
        throw IOError("Truncated npy data: " + pathStr);
    }

    const unsigned char* p = data.data() + dataStart;
    for (size_t i = 0; i < count; ++i) {
        if (itemSize == 4) {
            uint32_t bits = getU32LE(p + i * 4);
            float v;
            std::memcpy(&v, &bits, sizeof(v));
            matrix.data[i] = v;
        } else {
            uint64_t bits = getU64LE(p + i * 8);
            double v;
            std::memcpy(&v, &bits, sizeof(v));
            matrix.data[i] = static_cast<float>(v);
        }
    }
    return matrix;
}

} // namespace StemPrep
