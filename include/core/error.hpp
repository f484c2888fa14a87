#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace stegbmp {

// Closed set of failure kinds. Every library error is a StegError tagged
// with one of these.
enum class ErrorKind : uint8_t {
    UnsupportedFormat,
    MalformedInput,
    CapacityExceeded,
    PayloadContainsTerminator,
    TerminatorNotFound,
    InvalidEncoding,
    NotAContainer,
    Integrity,
    UnknownColorModel,
    UnsupportedColorModel,
    DecompressionFailed,
    Io,
};

const char* error_kind_name(ErrorKind kind);

class StegError : public std::runtime_error {
public:
    StegError(ErrorKind kind, const std::string& msg,
              uint64_t expected = 0, uint64_t actual = 0)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + msg),
          kind_(kind), expected_(expected), actual_(actual) {}

    ErrorKind kind() const { return kind_; }
    // Meaning depends on kind, e.g. capacity/payload size for CapacityExceeded,
    // computed/found CRC for Integrity.
    uint64_t expected() const { return expected_; }
    uint64_t actual() const { return actual_; }

private:
    ErrorKind kind_;
    uint64_t expected_;
    uint64_t actual_;
};

} // namespace stegbmp
