#include "cli/cli_parser.hpp"
#include "bmp/bmp_image.hpp"
#include "core/error.hpp"
#include "io/file_io.hpp"
#include "png/chunk_reader.hpp"
#include "stego/lsb.hpp"

#include <iostream>

namespace {

const char* kUsage =
    "Usage: stegbmp <command> [options]\n"
    "  check <file.bmp>               print capacity in bytes\n"
    "  store <file.bmp> <text>        hide UTF-8 text, write <name>.mod<ext>\n"
    "  retrieve <file.bmp>            print hidden text\n"
    "  inspect <file.png>             list chunks and header metadata\n"
    "Options:\n"
    "  --padded             rows are padded to 4-byte boundaries\n"
    "  --always-terminate   always write the zero terminator on store\n"
    "  --out <path>         output path for store\n"
    "  --verbose            print container details to stderr\n";

int usage() {
    std::cout << kUsage;
    return 1;
}

stegbmp::BmpImage load_bmp(const stegbmp::CliParser& cli, const std::string& path) {
    const auto layout = cli.has("padded") ? stegbmp::RowLayout::Padded : stegbmp::RowLayout::Packed;
    auto img = stegbmp::parse_bmp(stegbmp::read_all(path), layout);
    if (cli.has("verbose")) {
        std::cerr << path << ": " << img.width << "x" << img.height
                  << " bpp=" << img.bits_per_pixel
                  << " pixel_offset=" << img.pixel_offset
                  << " pixel_bytes=" << img.pixel_bytes.size()
                  << " layout=" << (layout == stegbmp::RowLayout::Padded ? "padded" : "packed")
                  << "\n";
    }
    return img;
}

int run_inspect(const stegbmp::CliParser& cli, const std::string& path) {
    const auto s = stegbmp::summarize_png(stegbmp::read_all(path));
    for (const auto& c : s.chunks) {
        std::cout << c.type_name() << " " << c.data.size() << " bytes"
                  << (c.critical() ? " critical" : "") << "\n";
    }
    std::cout << "width: " << s.info.width << "\n"
              << "height: " << s.info.height << "\n"
              << "bit depth: " << static_cast<int>(s.info.bit_depth) << "\n"
              << "color model: " << s.info.color.name << " (" << s.info.color.channels << " channels)\n"
              << "image data: " << s.decompressed_bytes << " bytes inflated, "
              << s.expected_raw_bytes << " expected\n";
    if (cli.has("verbose")) {
        std::cerr << "approximate pixel count (unfiltered): " << s.approx_pixel_count << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        stegbmp::CliParser cli({"out"});
        cli.parse(argc, argv);
        const auto& args = cli.positional();
        if (args.empty()) return usage();

        const std::string& cmd = args[0];
        if (cmd == "check" && args.size() == 2) {
            auto img = load_bmp(cli, args[1]);
            std::cout << stegbmp::bmp_capacity(img) << "\n";
            return 0;
        }
        if (cmd == "store" && args.size() == 3) {
            auto img = load_bmp(cli, args[1]);
            stegbmp::StoreOptions opts;
            opts.always_terminate = cli.has("always-terminate");
            stegbmp::store_text(img, args[2], opts);
            const std::string out = cli.get("out", stegbmp::modified_path(args[1]));
            stegbmp::write_all(out, stegbmp::serialize_bmp(img));
            std::cout << "Wrote: " << out << "\n";
            return 0;
        }
        if (cmd == "retrieve" && args.size() == 2) {
            auto img = load_bmp(cli, args[1]);
            std::cout << stegbmp::retrieve_text(img) << "\n";
            return 0;
        }
        if (cmd == "inspect" && args.size() == 2) {
            return run_inspect(cli, args[1]);
        }
        return usage();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
