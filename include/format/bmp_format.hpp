#pragma once

#include <cstdint>

namespace stegbmp {

// Bitmap file layout, little-endian:
//
//   off  size  field
//   0    2     magic "BM"
//   10   4     pixel data offset (uint32)
//   14   ..    format descriptor (opaque, up to pixel data offset)
//   18   4     width (int32)
//   22   4     height (int32, negative for top-down rows)
//   28   2     bits per pixel (uint16)
//   [pixel data offset .. EOF] pixel bytes
inline constexpr uint8_t  kBmpMagic0 = 'B';
inline constexpr uint8_t  kBmpMagic1 = 'M';

inline constexpr uint32_t kBmpFixedHeaderBytes = 14;
inline constexpr uint32_t kBmpPixelOffsetField = 10;
inline constexpr uint32_t kBmpWidthField = 18;
inline constexpr uint32_t kBmpHeightField = 22;
inline constexpr uint32_t kBmpBitsPerPixelField = 28;

// Smallest file that still holds every field read above.
inline constexpr uint32_t kBmpMinHeaderBytes = 30;

// Channels that carry payload bits in every pixel record.
inline constexpr uint32_t kUsableChannelsPerPixel = 3;

inline constexpr uint32_t kBmpRowAlignment = 4;

} // namespace stegbmp
