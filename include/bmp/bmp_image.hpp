#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "bmp/pixel_view.hpp"

namespace stegbmp {

// Parsed bitmap container. fixed_header and format_descriptor are kept
// verbatim so serialize_bmp reproduces the input byte for byte.
struct BmpImage {
    std::vector<uint8_t> fixed_header;      // bytes [0, 14)
    std::vector<uint8_t> format_descriptor; // bytes [14, pixel_offset)
    std::vector<uint8_t> pixel_bytes;       // bytes [pixel_offset, EOF)

    uint32_t pixel_offset = 0;
    int32_t width = 0;
    int32_t height = 0;      // negative: top-down rows
    uint16_t bits_per_pixel = 0;
    RowLayout row_layout = RowLayout::Packed;

    int bytes_per_pixel() const { return bits_per_pixel / 8; }
    int rows() const { return height < 0 ? -height : height; }
    // Non-color channel leads each record in 32-bit images.
    bool has_extra_channel() const { return bytes_per_pixel() == 4; }
    size_t storage_pixels() const { return static_cast<size_t>(width) * static_cast<size_t>(rows()); }
    PixelLayout layout() const;
};

// Parse a bitmap file held in memory.
// Throws StegError: UnsupportedFormat (magic, bit depth), MalformedInput (sizes, offsets).
BmpImage parse_bmp(const std::vector<uint8_t>& bytes, RowLayout row_layout = RowLayout::Packed);

// fixed_header || format_descriptor || pixel_bytes
std::vector<uint8_t> serialize_bmp(const BmpImage& img);

// Payload capacity in bytes: floor(width * |height| * 3 / 8).
uint64_t bmp_capacity(const BmpImage& img);
uint64_t bmp_capacity(int32_t width, int32_t height);

} // namespace stegbmp
