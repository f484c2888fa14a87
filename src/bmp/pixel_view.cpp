#include "bmp/pixel_view.hpp"

#include "core/error.hpp"
#include "format/bmp_format.hpp"

#include <cstddef>
#include <string>

namespace stegbmp {

size_t PixelLayout::row_stride() const {
    const size_t raw = static_cast<size_t>(width) * static_cast<size_t>(bytes_per_pixel);
    if (row_layout == RowLayout::Packed) return raw;
    return (raw + kBmpRowAlignment - 1) / kBmpRowAlignment * kBmpRowAlignment;
}

std::vector<PixelRecord> read_pixels(const std::vector<uint8_t>& buffer, const PixelLayout& layout) {
    if (layout.bytes_per_pixel <= 0) {
        throw StegError(ErrorKind::MalformedInput, "read_pixels: bytes_per_pixel must be positive");
    }
    const size_t bpp = static_cast<size_t>(layout.bytes_per_pixel);
    std::vector<PixelRecord> records;

    if (layout.row_layout == RowLayout::Packed) {
        const size_t count = buffer.size() / bpp;
        records.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            auto first = buffer.begin() + static_cast<std::ptrdiff_t>(i * bpp);
            records.emplace_back(first, first + static_cast<std::ptrdiff_t>(bpp));
        }
        return records;
    }

    const size_t stride = layout.row_stride();
    const size_t rows = static_cast<size_t>(layout.rows);
    const size_t width = static_cast<size_t>(layout.width);
    if (buffer.size() < stride * rows) {
        throw StegError(ErrorKind::MalformedInput,
                        "read_pixels: buffer holds " + std::to_string(buffer.size()) +
                        " bytes, padded rows need " + std::to_string(stride * rows),
                        stride * rows, buffer.size());
    }
    records.reserve(width * rows);
    for (size_t y = 0; y < rows; ++y) {
        for (size_t x = 0; x < width; ++x) {
            auto first = buffer.begin() + static_cast<std::ptrdiff_t>(y * stride + x * bpp);
            records.emplace_back(first, first + static_cast<std::ptrdiff_t>(bpp));
        }
    }
    return records;
}

std::vector<uint8_t> write_pixels(const std::vector<uint8_t>& buffer,
                                  const std::vector<PixelRecord>& records,
                                  const PixelLayout& layout) {
    if (layout.row_layout == RowLayout::Packed) {
        std::vector<uint8_t> out;
        out.reserve(buffer.size());
        for (const auto& r : records) {
            out.insert(out.end(), r.begin(), r.end());
        }
        return out;
    }

    std::vector<uint8_t> out = buffer;
    const size_t stride = layout.row_stride();
    const size_t bpp = static_cast<size_t>(layout.bytes_per_pixel);
    const size_t width = static_cast<size_t>(layout.width);
    for (size_t i = 0; i < records.size(); ++i) {
        const size_t off = (i / width) * stride + (i % width) * bpp;
        for (size_t k = 0; k < records[i].size() && off + k < out.size(); ++k) {
            out[off + k] = records[i][k];
        }
    }
    return out;
}

#ifndef NDEBUG
namespace {
// Self-test: a padded 3x2 image must survive read -> write unchanged.
struct PixelViewSelfTest {
    PixelViewSelfTest() {
        PixelLayout layout;
        layout.bytes_per_pixel = 3;
        layout.width = 3;
        layout.rows = 2;
        layout.row_layout = RowLayout::Padded;

        // stride = 12: 9 pixel bytes + 3 padding bytes per row
        std::vector<uint8_t> buf = {
            1, 2, 3, 4, 5, 6, 7, 8, 9, 0xAA, 0xBB, 0xCC,
            10, 11, 12, 13, 14, 15, 16, 17, 18, 0xDD, 0xEE, 0xFF
        };
        auto records = read_pixels(buf, layout);
        if (records.size() != 6 || records[3] != PixelRecord{10, 11, 12}) {
            throw std::runtime_error("pixel view self-test: padded read mismatch");
        }
        if (write_pixels(buf, records, layout) != buf) {
            throw std::runtime_error("pixel view self-test: round-trip mismatch");
        }
    }
};
static PixelViewSelfTest _pixel_view_self_test{};
} // namespace
#endif

} // namespace stegbmp
