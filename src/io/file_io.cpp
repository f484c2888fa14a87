#include "io/file_io.hpp"

#include "core/error.hpp"

#include <filesystem>
#include <fstream>

namespace stegbmp {

std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw StegError(ErrorKind::Io, "cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    std::streamsize n = ifs.tellg();
    if (n < 0) throw StegError(ErrorKind::Io, "cannot determine size of file: " + path);
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) {
        throw StegError(ErrorKind::Io, "short read on file: " + path,
                        static_cast<uint64_t>(n), static_cast<uint64_t>(ifs.gcount()));
    }
    return buf;
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw StegError(ErrorKind::Io, "cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw StegError(ErrorKind::Io, "write failed: " + path);
}

std::string modified_path(const std::string& path) {
    namespace fs = std::filesystem;
    fs::path p(path);
    fs::path out = p.parent_path() / p.stem();
    out += ".mod";
    out += p.extension();
    return out.string();
}

} // namespace stegbmp
