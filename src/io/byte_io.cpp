#include "io/byte_io.hpp"

namespace stegbmp {

namespace {
void need_at(const std::vector<uint8_t>& b, size_t off, size_t n) {
    if (off + n > b.size()) {
        throw StegError(ErrorKind::MalformedInput,
                        "field at offset " + std::to_string(off) + " (" + std::to_string(n) +
                        " bytes) lies past end of " + std::to_string(b.size()) + "-byte buffer",
                        off + n, b.size());
    }
}
} // namespace

uint16_t read_u16_le_at(const std::vector<uint8_t>& b, size_t off) {
    need_at(b, off, 2);
    return static_cast<uint16_t>(b[off] | (static_cast<uint16_t>(b[off + 1]) << 8));
}

uint32_t read_u32_le_at(const std::vector<uint8_t>& b, size_t off) {
    need_at(b, off, 4);
    return static_cast<uint32_t>(b[off] |
                                 (static_cast<uint32_t>(b[off + 1]) << 8) |
                                 (static_cast<uint32_t>(b[off + 2]) << 16) |
                                 (static_cast<uint32_t>(b[off + 3]) << 24));
}

int32_t read_i32_le_at(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<int32_t>(read_u32_le_at(b, off));
}

uint32_t read_u32_be_at(const std::vector<uint8_t>& b, size_t off) {
    need_at(b, off, 4);
    return (static_cast<uint32_t>(b[off]) << 24) |
           (static_cast<uint32_t>(b[off + 1]) << 16) |
           (static_cast<uint32_t>(b[off + 2]) << 8) |
           static_cast<uint32_t>(b[off + 3]);
}

} // namespace stegbmp
