#pragma once

#include <array>
#include <cstdint>

namespace stegbmp {

// Chunked container layout, big-endian:
//
//   [signature 8 bytes]
//   repeated: [length u32][type 4][data length bytes][crc32 u32 over type+data]
inline constexpr std::array<uint8_t, 8> kPngSignature = {
    0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A
};

inline constexpr uint32_t kChunkOverheadBytes = 12; // length + type + crc

// Header chunk data layout
inline constexpr uint32_t kIhdrDataBytes = 13;
inline constexpr uint32_t kIhdrWidthField = 0;
inline constexpr uint32_t kIhdrHeightField = 4;
inline constexpr uint32_t kIhdrBitDepthField = 8;
inline constexpr uint32_t kIhdrColorTypeField = 9;

inline constexpr char kChunkHeader[] = "IHDR";
inline constexpr char kChunkPalette[] = "PLTE";
inline constexpr char kChunkImageData[] = "IDAT";
inline constexpr char kChunkEnd[] = "IEND";

} // namespace stegbmp
