#include "stego/lsb.hpp"

#include "core/error.hpp"
#include "core/utf8.hpp"
#include "format/bmp_format.hpp"

#include <algorithm>
#include <cstdio>

namespace stegbmp {

namespace {

// First usable channel index in a record: the leading non-color byte of a
// 32-bit pixel is skipped.
size_t first_usable_channel(const BmpImage& img) {
    return img.has_extra_channel() ? 1u : 0u;
}

void check_utf8(const std::vector<uint8_t>& bytes, const char* where) {
    const size_t bad = utf8_error_offset(bytes);
    if (bad != bytes.size()) {
        throw StegError(ErrorKind::InvalidEncoding,
                        std::string(where) + ": invalid UTF-8 at byte " + std::to_string(bad),
                        bytes.size(), bad);
    }
}

} // namespace

std::vector<uint8_t> bytes_to_bits(const std::vector<uint8_t>& bytes) {
    std::vector<uint8_t> bits;
    bits.reserve(bytes.size() * 8);
    for (uint8_t b : bytes) {
        for (int i = 7; i >= 0; --i) {
            bits.push_back(static_cast<uint8_t>((b >> i) & 1u));
        }
    }
    return bits;
}

void store(BmpImage& img, const std::vector<uint8_t>& payload, const StoreOptions& opts) {
    auto zero = std::find(payload.begin(), payload.end(), kTerminatorByte);
    if (zero != payload.end()) {
        const auto idx = static_cast<uint64_t>(zero - payload.begin());
        throw StegError(ErrorKind::PayloadContainsTerminator,
                        "payload byte " + std::to_string(idx) + " is the zero terminator",
                        0, idx);
    }

    const uint64_t capacity = bmp_capacity(img);
    const uint64_t size = payload.size();
    if (size > capacity) {
        throw StegError(ErrorKind::CapacityExceeded,
                        "payload of " + std::to_string(size) + " bytes exceeds capacity of " +
                        std::to_string(capacity) + " bytes",
                        capacity, size);
    }

    std::vector<uint8_t> stream = payload;
    if (size == capacity || opts.always_terminate) {
        stream.push_back(kTerminatorByte);
    }
    std::vector<uint8_t> bits = bytes_to_bits(stream);

    const PixelLayout layout = img.layout();
    std::vector<PixelRecord> records = read_pixels(img.pixel_bytes, layout);
    const size_t storage = std::min(records.size(), img.storage_pixels());
    const size_t first = first_usable_channel(img);
    const size_t per_pixel = static_cast<size_t>(img.bytes_per_pixel()) - first;

    // An exact fill may leave the tail of the terminator without room; the
    // payload itself must always fit.
    const size_t payload_bits = payload.size() * 8;
    if (payload_bits > storage * per_pixel) {
        throw StegError(ErrorKind::MalformedInput,
                        "pixel data holds " + std::to_string(storage) +
                        " pixels, payload needs " +
                        std::to_string((payload_bits + per_pixel - 1) / per_pixel),
                        (payload_bits + per_pixel - 1) / per_pixel, storage);
    }

    size_t bit = 0;
    for (size_t p = 0; p < storage && bit < bits.size(); ++p) {
        PixelRecord& rec = records[p];
        for (size_t c = first; c < rec.size(); ++c) {
            uint8_t v = static_cast<uint8_t>((rec[c] >> 1) << 1);
            if (bit < bits.size()) {
                v = static_cast<uint8_t>(v | bits[bit++]);
            }
            rec[c] = v;
        }
    }

#ifndef NDEBUG
    std::fprintf(stderr, "store: %zu payload bytes, %zu of %zu stream bits written, capacity %llu\n",
                 payload.size(), bit, bits.size(), static_cast<unsigned long long>(capacity));
#endif
    img.pixel_bytes = write_pixels(img.pixel_bytes, records, layout);
}

std::vector<uint8_t> retrieve(const BmpImage& img) {
    const std::vector<PixelRecord> records = read_pixels(img.pixel_bytes, img.layout());
    const size_t storage = std::min(records.size(), img.storage_pixels());
    const size_t first = first_usable_channel(img);

    std::vector<uint8_t> out;
    uint8_t cur = 0;
    int filled = 0;
    for (size_t p = 0; p < storage; ++p) {
        const PixelRecord& rec = records[p];
        for (size_t c = first; c < rec.size(); ++c) {
            cur = static_cast<uint8_t>((cur << 1) | (rec[c] % 2));
            if (++filled < 8) continue;
            if (cur == kTerminatorByte) {
#ifndef NDEBUG
                std::fprintf(stderr, "retrieve: terminator after %zu bytes\n", out.size());
#endif
                return out;
            }
            out.push_back(cur);
            cur = 0;
            filled = 0;
        }
    }

    // Storage ran out. An exact-fill store leaves a terminator truncated to
    // the remaining (< 8) zero bits, or drops it entirely.
    if (out.size() == bmp_capacity(img) && cur == 0) {
        return out;
    }
    throw StegError(ErrorKind::TerminatorNotFound,
                    "no zero terminator within " + std::to_string(out.size()) +
                    " extracted bytes (" + std::to_string(storage) + " pixels scanned)",
                    bmp_capacity(img), out.size());
}

void store_text(BmpImage& img, const std::string& text, const StoreOptions& opts) {
    std::vector<uint8_t> bytes(text.begin(), text.end());
    check_utf8(bytes, "store");
    store(img, bytes, opts);
}

std::string retrieve_text(const BmpImage& img) {
    std::vector<uint8_t> bytes = retrieve(img);
    check_utf8(bytes, "retrieve");
    return std::string(bytes.begin(), bytes.end());
}

} // namespace stegbmp
