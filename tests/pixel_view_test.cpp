#include "bmp/pixel_view.hpp"

#include <gtest/gtest.h>

namespace stegbmp {
namespace {

TEST(PixelViewTest, PackedRecordsFollowFileOrder) {
    PixelLayout layout;
    layout.bytes_per_pixel = 4;
    layout.width = 2;
    layout.rows = 1;
    std::vector<uint8_t> buf = {1, 2, 3, 4, 5, 6, 7, 8};

    auto records = read_pixels(buf, layout);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (PixelRecord{1, 2, 3, 4}));
    EXPECT_EQ(records[1], (PixelRecord{5, 6, 7, 8}));
}

TEST(PixelViewTest, PackedWriteConcatenates) {
    PixelLayout layout;
    layout.bytes_per_pixel = 3;
    std::vector<PixelRecord> records = {{9, 8, 7}, {6, 5, 4}};
    EXPECT_EQ(write_pixels({}, records, layout), (std::vector<uint8_t>{9, 8, 7, 6, 5, 4}));
}

TEST(PixelViewTest, PaddedReadSkipsRowPadding) {
    PixelLayout layout;
    layout.bytes_per_pixel = 3;
    layout.width = 1;
    layout.rows = 2;
    layout.row_layout = RowLayout::Padded;
    ASSERT_EQ(layout.row_stride(), 4u);

    std::vector<uint8_t> buf = {1, 2, 3, 0xEE, 4, 5, 6, 0xEE};
    auto records = read_pixels(buf, layout);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1], (PixelRecord{4, 5, 6}));
}

TEST(PixelViewTest, PaddedWriteKeepsPaddingAndTrailingBytes) {
    PixelLayout layout;
    layout.bytes_per_pixel = 3;
    layout.width = 1;
    layout.rows = 2;
    layout.row_layout = RowLayout::Padded;

    std::vector<uint8_t> buf = {1, 2, 3, 0xEE, 4, 5, 6, 0xEE, 0x42};
    auto records = read_pixels(buf, layout);
    records[0] = {10, 20, 30};
    auto out = write_pixels(buf, records, layout);
    EXPECT_EQ(out, (std::vector<uint8_t>{10, 20, 30, 0xEE, 4, 5, 6, 0xEE, 0x42}));
}

TEST(PixelViewTest, PackedStrideHasNoPadding) {
    PixelLayout layout;
    layout.bytes_per_pixel = 3;
    layout.width = 5;
    EXPECT_EQ(layout.row_stride(), 15u);
    layout.row_layout = RowLayout::Padded;
    EXPECT_EQ(layout.row_stride(), 16u);
}

} // namespace
} // namespace stegbmp
