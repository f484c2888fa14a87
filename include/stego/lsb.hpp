#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "bmp/bmp_image.hpp"

namespace stegbmp {

inline constexpr uint8_t kTerminatorByte = 0x00;

struct StoreOptions {
    // Write the zero terminator even when spare capacity remains. Off by
    // default: only an exactly-filling payload gets an explicit terminator.
    bool always_terminate = false;
};

// Flatten bytes to bits, most significant bit first, byte order preserved.
std::vector<uint8_t> bytes_to_bits(const std::vector<uint8_t>& bytes);

// Embed payload into the LSBs of the usable channels of img, in place.
// On failure img is left untouched.
// Throws StegError: PayloadContainsTerminator, CapacityExceeded, MalformedInput.
void store(BmpImage& img, const std::vector<uint8_t>& payload, const StoreOptions& opts = {});

// Recover the payload written by store().
// Throws StegError(TerminatorNotFound) when no zero byte ends the stream.
std::vector<uint8_t> retrieve(const BmpImage& img);

// UTF-8 text front ends; both validate encoding (InvalidEncoding).
void store_text(BmpImage& img, const std::string& text, const StoreOptions& opts = {});
std::string retrieve_text(const BmpImage& img);

} // namespace stegbmp
