#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace stegbmp {

struct Chunk {
    std::array<char, 4> type{};
    std::vector<uint8_t> data;
    uint32_t crc = 0;

    std::string type_name() const { return std::string(type.begin(), type.end()); }
    bool is(const char* t) const;
    // IHDR, PLTE, IDAT, IEND
    bool critical() const;
};

enum class ColorModel : uint8_t {
    Grayscale = 0,
    RGB = 2,
    Indexed = 3,
    GrayscaleAlpha = 4,
    RGBA = 6,
};

struct ColorModelInfo {
    ColorModel model;
    const char* name;
    int channels;
};

// Lookup in the fixed color-type table.
// Throws StegError(UnknownColorModel) for codes outside it.
ColorModelInfo color_model_from_code(uint8_t code);

struct PngInfo {
    uint32_t width = 0;
    uint32_t height = 0;
    uint8_t bit_depth = 0;
    ColorModelInfo color{ColorModel::RGBA, "RGBA", 4};
};

// CRC-32 over type || data.
uint32_t chunk_crc(const std::array<char, 4>& type, const std::vector<uint8_t>& data);

// Parse signature and the full chunk sequence, verifying every CRC.
// Throws StegError: NotAContainer, MalformedInput, Integrity.
std::vector<Chunk> parse_chunks(const std::vector<uint8_t>& bytes);

// Decode the header fields of the first chunk. Only RGBA is accepted.
// Throws StegError: MalformedInput, UnknownColorModel, UnsupportedColorModel.
PngInfo read_png_info(const std::vector<Chunk>& chunks);

// Inflate the concatenated IDAT data. Scanlines are returned still filtered.
// Throws StegError(DecompressionFailed).
std::vector<uint8_t> inflate_image_data(const std::vector<Chunk>& chunks);

struct PngSummary {
    std::vector<Chunk> chunks;
    PngInfo info;
    size_t decompressed_bytes = 0;
    size_t expected_raw_bytes = 0;   // rows * (filter byte + packed row)
    size_t approx_pixel_count = 0;   // decompressed / bytes per pixel, filter bytes included
};

PngSummary summarize_png(const std::vector<uint8_t>& bytes);

} // namespace stegbmp
