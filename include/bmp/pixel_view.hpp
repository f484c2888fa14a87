#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stegbmp {

enum class RowLayout : uint8_t {
    Packed = 0, // one flat run of records, no scanline padding
    Padded = 1, // every row padded to a 4-byte boundary
};

struct PixelLayout {
    int bytes_per_pixel = 3;
    int width = 0;
    int rows = 0;               // |height|
    RowLayout row_layout = RowLayout::Packed;

    // Bytes per scanline including padding (Padded) or width * bpp (Packed).
    size_t row_stride() const;
};

using PixelRecord = std::vector<uint8_t>;

// Read projection: split the flat pixel buffer into records in file order.
// Packed: size / bytes_per_pixel records. Padded: width * rows records.
std::vector<PixelRecord> read_pixels(const std::vector<uint8_t>& buffer, const PixelLayout& layout);

// Write projection: reassemble records into a flat buffer.
// Packed: plain concatenation. Padded: records are written over a copy of
// `buffer`, so row padding and trailing bytes survive unchanged.
// Record lengths are not validated.
std::vector<uint8_t> write_pixels(const std::vector<uint8_t>& buffer,
                                  const std::vector<PixelRecord>& records,
                                  const PixelLayout& layout);

} // namespace stegbmp
