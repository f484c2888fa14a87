#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "core/error.hpp"

namespace stegbmp {

class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_u32_be(uint32_t v) {
        buf_.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    const std::vector<uint8_t>& bytes() const { return buf_; }
private:
    std::vector<uint8_t> buf_;
};

// Cursor over a borrowed buffer. The buffer must outlive the reader.
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : buf_(data) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint32_t read_u32_be() {
        need(4);
        uint32_t v = (static_cast<uint32_t>(buf_[pos_]) << 24) |
                     (static_cast<uint32_t>(buf_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(buf_[pos_ + 2]) << 8) |
                     static_cast<uint32_t>(buf_[pos_ + 3]);
        pos_ += 4;
        return v;
    }
    void read_bytes(void* out, size_t n) {
        need(n);
        if (n != 0) std::memcpy(out, buf_.data() + pos_, n);
        pos_ += n;
    }
    std::vector<uint8_t> read_vector(size_t n) {
        need(n);
        std::vector<uint8_t> out(buf_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                 buf_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        return out;
    }
    bool eof() const { return pos_ >= buf_.size(); }
    size_t remaining() const { return buf_.size() - pos_; }
    size_t position() const { return pos_; }
private:
    void need(size_t n) {
        if (n > remaining()) {
            throw StegError(ErrorKind::MalformedInput,
                            "premature end of data at offset " + std::to_string(pos_) +
                            " (need " + std::to_string(n) + " bytes, have " +
                            std::to_string(remaining()) + ")",
                            n, remaining());
        }
    }
    const std::vector<uint8_t>& buf_;
    size_t pos_ = 0;
};

// Fixed-offset field access, bounds checked.
uint16_t read_u16_le_at(const std::vector<uint8_t>& b, size_t off);
uint32_t read_u32_le_at(const std::vector<uint8_t>& b, size_t off);
int32_t read_i32_le_at(const std::vector<uint8_t>& b, size_t off);
uint32_t read_u32_be_at(const std::vector<uint8_t>& b, size_t off);

} // namespace stegbmp
