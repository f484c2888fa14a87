#include "bmp/bmp_image.hpp"
#include "core/error.hpp"

#include "test_images.hpp"

#include <gtest/gtest.h>

namespace stegbmp {
namespace {

ErrorKind parse_error_kind(const std::vector<uint8_t>& bytes, RowLayout layout = RowLayout::Packed) {
    try {
        parse_bmp(bytes, layout);
    } catch (const StegError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "parse_bmp did not throw";
    return ErrorKind::Io;
}

TEST(BmpImageTest, ParsesHeaderFields) {
    auto bytes = test::make_filled_bmp(10, 10, 24, 0x80);
    BmpImage img = parse_bmp(bytes);
    EXPECT_EQ(img.width, 10);
    EXPECT_EQ(img.height, 10);
    EXPECT_EQ(img.bits_per_pixel, 24);
    EXPECT_EQ(img.bytes_per_pixel(), 3);
    EXPECT_EQ(img.pixel_offset, 54u);
    EXPECT_EQ(img.fixed_header.size(), 14u);
    EXPECT_EQ(img.format_descriptor.size(), 40u);
    EXPECT_EQ(img.pixel_bytes.size(), 300u);
    EXPECT_FALSE(img.has_extra_channel());
}

TEST(BmpImageTest, SerializeReproducesInput) {
    auto bytes = test::make_pattern_bmp(7, 5, 32);
    EXPECT_EQ(serialize_bmp(parse_bmp(bytes)), bytes);
}

TEST(BmpImageTest, CapacityIsThreeBitsPerPixel) {
    EXPECT_EQ(bmp_capacity(parse_bmp(test::make_filled_bmp(10, 10, 24, 0))), 37u);
    EXPECT_EQ(bmp_capacity(parse_bmp(test::make_filled_bmp(10, 10, 32, 0))), 37u);
    EXPECT_EQ(bmp_capacity(8, 1), 3u);
    EXPECT_EQ(bmp_capacity(1, 2), 0u);
}

TEST(BmpImageTest, TopDownHeightUsesMagnitude) {
    BmpImage img = parse_bmp(test::make_filled_bmp(4, -3, 24, 0));
    EXPECT_EQ(img.height, -3);
    EXPECT_EQ(img.rows(), 3);
    EXPECT_EQ(bmp_capacity(img), 4u * 3u * 3u / 8u);
}

TEST(BmpImageTest, RejectsBadMagicBeforeReadingHeader) {
    std::vector<uint8_t> bytes = {'P', 'K'};
    EXPECT_EQ(parse_error_kind(bytes), ErrorKind::UnsupportedFormat);

    auto bmp = test::make_filled_bmp(4, 4, 24, 0);
    bmp[1] = 'X';
    EXPECT_EQ(parse_error_kind(bmp), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(parse_error_kind({}), ErrorKind::UnsupportedFormat);
}

TEST(BmpImageTest, RejectsLowBitDepth) {
    auto bytes = test::make_bmp(4, 4, 8, std::vector<uint8_t>(16, 0));
    try {
        parse_bmp(bytes);
        FAIL() << "expected UnsupportedFormat";
    } catch (const StegError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
        EXPECT_EQ(e.actual(), 8u);
        EXPECT_NE(std::string(e.what()).find("8"), std::string::npos);
    }
}

TEST(BmpImageTest, RejectsTruncatedHeader) {
    auto bytes = test::make_filled_bmp(4, 4, 24, 0);
    bytes.resize(20);
    EXPECT_EQ(parse_error_kind(bytes), ErrorKind::MalformedInput);
}

TEST(BmpImageTest, RejectsPixelOffsetPastEnd) {
    auto bytes = test::make_filled_bmp(4, 4, 24, 0);
    bytes[10] = 0xFF;
    bytes[11] = 0xFF;
    EXPECT_EQ(parse_error_kind(bytes), ErrorKind::MalformedInput);
}

TEST(BmpImageTest, RejectsRaggedPixelData) {
    auto bytes = test::make_filled_bmp(4, 4, 24, 0);
    bytes.push_back(0);
    EXPECT_EQ(parse_error_kind(bytes), ErrorKind::MalformedInput);
}

TEST(BmpImageTest, PaddedLayoutRequiresFullRows) {
    // 5 px * 3 bytes = 15 -> stride 16
    auto ok = test::make_bmp(5, 2, 24, std::vector<uint8_t>(32, 0));
    BmpImage img = parse_bmp(ok, RowLayout::Padded);
    EXPECT_EQ(img.layout().row_stride(), 16u);

    auto short_rows = test::make_bmp(5, 2, 24, std::vector<uint8_t>(30, 0));
    EXPECT_EQ(parse_error_kind(short_rows, RowLayout::Padded), ErrorKind::MalformedInput);
    // the same 30 bytes are a valid packed buffer
    EXPECT_NO_THROW(parse_bmp(short_rows, RowLayout::Packed));
}

TEST(BmpImageTest, ParsingTwiceGivesSameDerivedFields) {
    auto bytes = test::make_pattern_bmp(9, 6, 32);
    BmpImage a = parse_bmp(bytes);
    BmpImage b = parse_bmp(bytes);
    EXPECT_EQ(a.width, b.width);
    EXPECT_EQ(a.height, b.height);
    EXPECT_EQ(a.bytes_per_pixel(), b.bytes_per_pixel());
    EXPECT_EQ(bmp_capacity(a), bmp_capacity(b));
    EXPECT_EQ(a.pixel_bytes, b.pixel_bytes);
}

} // namespace
} // namespace stegbmp
