#pragma once

#include <stdexcept>
#include <string>

namespace StemPrep {

// Source file could not be opened, demuxed or decoded as an audio container.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

// Directory or file creation / write / read failed.
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace StemPrep
