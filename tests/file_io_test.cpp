#include "io/file_io.hpp"
#include "core/error.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace stegbmp {
namespace {

namespace fs = std::filesystem;

TEST(FileIoTest, ModifiedPathInsertsSuffixBeforeExtension) {
    EXPECT_EQ(modified_path("cover.bmp"), "cover.mod.bmp");
    EXPECT_EQ(modified_path("dir/cover.bmp"), (fs::path("dir") / "cover.mod.bmp").string());
    EXPECT_EQ(modified_path("noext"), "noext.mod");
}

TEST(FileIoTest, WriteThenReadReturnsSameBytes) {
    const fs::path p = fs::temp_directory_path() / "stegbmp_file_io_test.bin";
    const std::vector<uint8_t> bytes = {'B', 'M', 0, 1, 2, 0xFF};
    write_all(p.string(), bytes);
    EXPECT_EQ(read_all(p.string()), bytes);
    fs::remove(p);
}

TEST(FileIoTest, MissingFileIsIoError) {
    try {
        read_all("/nonexistent/stegbmp/missing.bmp");
        FAIL() << "expected Io";
    } catch (const StegError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
        EXPECT_NE(std::string(e.what()).find("missing.bmp"), std::string::npos);
    }
}

} // namespace
} // namespace stegbmp
