#include "png/chunk_reader.hpp"

#include "core/error.hpp"
#include "format/png_format.hpp"
#include "io/byte_io.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <utility>

namespace stegbmp {

namespace {

std::string hex32(uint32_t v) {
    std::ostringstream os;
    os << "0x" << std::hex << std::setw(8) << std::setfill('0') << v;
    return os.str();
}

const ColorModelInfo kColorModels[] = {
    {ColorModel::Grayscale,      "Grayscale",      1},
    {ColorModel::RGB,            "RGB",            3},
    {ColorModel::Indexed,        "Indexed",        1},
    {ColorModel::GrayscaleAlpha, "GrayscaleAlpha", 2},
    {ColorModel::RGBA,           "RGBA",           4},
};

} // namespace

bool Chunk::is(const char* t) const {
    return std::memcmp(type.data(), t, type.size()) == 0;
}

bool Chunk::critical() const {
    return is(kChunkHeader) || is(kChunkPalette) || is(kChunkImageData) || is(kChunkEnd);
}

ColorModelInfo color_model_from_code(uint8_t code) {
    for (const auto& m : kColorModels) {
        if (static_cast<uint8_t>(m.model) == code) return m;
    }
    throw StegError(ErrorKind::UnknownColorModel,
                    "color type " + std::to_string(code) + " is not defined", 0, code);
}

uint32_t chunk_crc(const std::array<char, 4>& type, const std::vector<uint8_t>& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type.data()), static_cast<uInt>(type.size()));
    // crc32 takes uInt lengths; feed large chunks in pieces
    size_t off = 0;
    while (off < data.size()) {
        const size_t n = std::min<size_t>(data.size() - off, 1u << 30);
        crc = crc32(crc, data.data() + off, static_cast<uInt>(n));
        off += n;
    }
    return static_cast<uint32_t>(crc);
}

std::vector<Chunk> parse_chunks(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kPngSignature.size() ||
        !std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin())) {
        throw StegError(ErrorKind::NotAContainer, "PNG signature mismatch");
    }

    ByteReader r(bytes);
    std::vector<uint8_t> sig(kPngSignature.size());
    r.read_bytes(sig.data(), sig.size());

    std::vector<Chunk> chunks;
    while (!r.eof()) {
        const size_t at = r.position();
        if (r.remaining() < kChunkOverheadBytes) {
            throw StegError(ErrorKind::MalformedInput,
                            "truncated chunk header at offset " + std::to_string(at),
                            kChunkOverheadBytes, r.remaining());
        }
        const uint32_t length = r.read_u32_be();
        Chunk c;
        r.read_bytes(c.type.data(), c.type.size());
        if (static_cast<uint64_t>(length) + 4 > r.remaining()) {
            throw StegError(ErrorKind::MalformedInput,
                            "chunk " + c.type_name() + " at offset " + std::to_string(at) +
                            " declares " + std::to_string(length) + " data bytes, only " +
                            std::to_string(r.remaining()) + " remain",
                            static_cast<uint64_t>(length) + 4, r.remaining());
        }
        c.data = r.read_vector(length);
        c.crc = r.read_u32_be();

        const uint32_t computed = chunk_crc(c.type, c.data);
        if (computed != c.crc) {
            throw StegError(ErrorKind::Integrity,
                            "chunk " + c.type_name() + " at offset " + std::to_string(at) +
                            ": computed CRC " + hex32(computed) + ", found " + hex32(c.crc),
                            computed, c.crc);
        }
        chunks.push_back(std::move(c));
    }

#ifndef NDEBUG
    std::fprintf(stderr, "parse_chunks: %zu chunks\n", chunks.size());
#endif
    return chunks;
}

PngInfo read_png_info(const std::vector<Chunk>& chunks) {
    if (chunks.empty()) {
        throw StegError(ErrorKind::MalformedInput, "container holds no chunks");
    }
    // first chunk is taken as the header without checking its type
    const Chunk& hdr = chunks.front();
    if (hdr.data.size() < kIhdrDataBytes) {
        throw StegError(ErrorKind::MalformedInput,
                        "header chunk " + hdr.type_name() + " has " + std::to_string(hdr.data.size()) +
                        " data bytes, need " + std::to_string(kIhdrDataBytes),
                        kIhdrDataBytes, hdr.data.size());
    }

    PngInfo info;
    info.width = read_u32_be_at(hdr.data, kIhdrWidthField);
    info.height = read_u32_be_at(hdr.data, kIhdrHeightField);
    info.bit_depth = hdr.data[kIhdrBitDepthField];
    info.color = color_model_from_code(hdr.data[kIhdrColorTypeField]);

    if (info.color.model != ColorModel::RGBA) {
        throw StegError(ErrorKind::UnsupportedColorModel,
                        std::string("color model ") + info.color.name + " is not supported (need RGBA)",
                        static_cast<uint64_t>(ColorModel::RGBA),
                        static_cast<uint64_t>(info.color.model));
    }
    return info;
}

std::vector<uint8_t> inflate_image_data(const std::vector<Chunk>& chunks) {
    std::vector<uint8_t> compressed;
    for (const auto& c : chunks) {
        if (c.is(kChunkImageData)) {
            compressed.insert(compressed.end(), c.data.begin(), c.data.end());
        }
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    int st = inflateInit(&zs);
    if (st != Z_OK) {
        throw StegError(ErrorKind::DecompressionFailed, "inflateInit failed", Z_OK,
                        static_cast<uint64_t>(static_cast<uint32_t>(st)));
    }

    std::vector<uint8_t> out;
    std::vector<uint8_t> buf(64 * 1024);
    zs.next_in = compressed.data();
    zs.avail_in = static_cast<uInt>(compressed.size());
    do {
        zs.next_out = buf.data();
        zs.avail_out = static_cast<uInt>(buf.size());
        st = inflate(&zs, Z_NO_FLUSH);
        if (st != Z_OK && st != Z_STREAM_END) {
            const std::string msg = zs.msg ? zs.msg : "inflate error";
            inflateEnd(&zs);
            throw StegError(ErrorKind::DecompressionFailed,
                            "image data: " + msg + " (zlib status " + std::to_string(st) + ")",
                            Z_STREAM_END, static_cast<uint64_t>(static_cast<uint32_t>(st)));
        }
        out.insert(out.end(), buf.data(), buf.data() + (buf.size() - zs.avail_out));
        if (st != Z_STREAM_END && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw StegError(ErrorKind::DecompressionFailed,
                            "image data ends before the deflate stream does");
        }
    } while (st != Z_STREAM_END);
    inflateEnd(&zs);
    return out;
}

PngSummary summarize_png(const std::vector<uint8_t>& bytes) {
    PngSummary s;
    s.chunks = parse_chunks(bytes);
    s.info = read_png_info(s.chunks);
    s.decompressed_bytes = inflate_image_data(s.chunks).size();

    const size_t bits_per_pixel = static_cast<size_t>(s.info.color.channels) * s.info.bit_depth;
    const size_t bytes_per_pixel = std::max<size_t>(1, (bits_per_pixel + 7) / 8);
    const size_t row_bytes = (static_cast<size_t>(s.info.width) * bits_per_pixel + 7) / 8;
    s.expected_raw_bytes = static_cast<size_t>(s.info.height) * (1 + row_bytes);
    s.approx_pixel_count = s.decompressed_bytes / bytes_per_pixel;
    return s;
}

} // namespace stegbmp
