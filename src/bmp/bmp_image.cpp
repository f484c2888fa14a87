#include "bmp/bmp_image.hpp"

#include "core/error.hpp"
#include "format/bmp_format.hpp"
#include "io/byte_io.hpp"

#include <cstdio>
#include <string>

namespace stegbmp {

PixelLayout BmpImage::layout() const {
    PixelLayout l;
    l.bytes_per_pixel = bytes_per_pixel();
    l.width = width;
    l.rows = rows();
    l.row_layout = row_layout;
    return l;
}

BmpImage parse_bmp(const std::vector<uint8_t>& bytes, RowLayout row_layout) {
    if (bytes.size() < 2 || bytes[0] != kBmpMagic0 || bytes[1] != kBmpMagic1) {
        const uint64_t found = bytes.size() < 2
            ? 0 : (static_cast<uint64_t>(bytes[0]) << 8) | bytes[1];
        throw StegError(ErrorKind::UnsupportedFormat, "missing 'BM' magic",
                        (static_cast<uint64_t>(kBmpMagic0) << 8) | kBmpMagic1, found);
    }
    if (bytes.size() < kBmpMinHeaderBytes) {
        throw StegError(ErrorKind::MalformedInput,
                        "file too small for bitmap header: " + std::to_string(bytes.size()) +
                        " bytes, need " + std::to_string(kBmpMinHeaderBytes),
                        kBmpMinHeaderBytes, bytes.size());
    }

    BmpImage img;
    img.row_layout = row_layout;
    img.pixel_offset = read_u32_le_at(bytes, kBmpPixelOffsetField);
    img.width = read_i32_le_at(bytes, kBmpWidthField);
    img.height = read_i32_le_at(bytes, kBmpHeightField);
    img.bits_per_pixel = read_u16_le_at(bytes, kBmpBitsPerPixelField);

    if (img.pixel_offset < kBmpMinHeaderBytes || img.pixel_offset > bytes.size()) {
        throw StegError(ErrorKind::MalformedInput,
                        "pixel data offset " + std::to_string(img.pixel_offset) +
                        " outside [" + std::to_string(kBmpMinHeaderBytes) + ", " +
                        std::to_string(bytes.size()) + "]",
                        bytes.size(), img.pixel_offset);
    }
    // INT32_MIN has no magnitude
    if (img.width <= 0 || img.height == 0 || img.height == INT32_MIN) {
        throw StegError(ErrorKind::MalformedInput,
                        "invalid dimensions " + std::to_string(img.width) + "x" +
                        std::to_string(img.height));
    }
    if (img.bits_per_pixel != 24 && img.bits_per_pixel != 32) {
        throw StegError(ErrorKind::UnsupportedFormat,
                        "unsupported bits per pixel " + std::to_string(img.bits_per_pixel) +
                        " (need 24 or 32)",
                        24, img.bits_per_pixel);
    }

    img.fixed_header.assign(bytes.begin(), bytes.begin() + kBmpFixedHeaderBytes);
    img.format_descriptor.assign(bytes.begin() + kBmpFixedHeaderBytes,
                                 bytes.begin() + img.pixel_offset);
    img.pixel_bytes.assign(bytes.begin() + img.pixel_offset, bytes.end());

    const size_t bpp = static_cast<size_t>(img.bytes_per_pixel());
    if (row_layout == RowLayout::Packed) {
        if (img.pixel_bytes.size() % bpp != 0) {
            throw StegError(ErrorKind::MalformedInput,
                            "pixel data length " + std::to_string(img.pixel_bytes.size()) +
                            " is not a multiple of " + std::to_string(bpp) + " bytes per pixel",
                            bpp, img.pixel_bytes.size());
        }
    } else {
        const size_t need = img.layout().row_stride() * static_cast<size_t>(img.rows());
        if (img.pixel_bytes.size() < need) {
            throw StegError(ErrorKind::MalformedInput,
                            "pixel data length " + std::to_string(img.pixel_bytes.size()) +
                            " shorter than padded rows need (" + std::to_string(need) + ")",
                            need, img.pixel_bytes.size());
        }
    }

#ifndef NDEBUG
    std::fprintf(stderr, "parse_bmp: %dx%d bpp=%u offset=%u pixel_bytes=%zu layout=%s\n",
                 img.width, img.height, static_cast<unsigned>(img.bits_per_pixel),
                 img.pixel_offset, img.pixel_bytes.size(),
                 row_layout == RowLayout::Packed ? "packed" : "padded");
#endif
    return img;
}

std::vector<uint8_t> serialize_bmp(const BmpImage& img) {
    ByteWriter w;
    w.write_bytes(img.fixed_header.data(), img.fixed_header.size());
    w.write_bytes(img.format_descriptor.data(), img.format_descriptor.size());
    w.write_bytes(img.pixel_bytes.data(), img.pixel_bytes.size());
    return w.bytes();
}

uint64_t bmp_capacity(int32_t width, int32_t height) {
    if (width <= 0 || height == 0) return 0;
    const uint64_t w = static_cast<uint64_t>(width);
    const uint64_t h = height < 0 ? static_cast<uint64_t>(-static_cast<int64_t>(height))
                                  : static_cast<uint64_t>(height);
    return w * h * kUsableChannelsPerPixel / 8;
}

uint64_t bmp_capacity(const BmpImage& img) {
    return bmp_capacity(img.width, img.height);
}

} // namespace stegbmp
