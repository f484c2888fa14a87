#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stegbmp {

// Whole-file helpers. Failures raise StegError(ErrorKind::Io).
std::vector<uint8_t> read_all(const std::string& path);
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

// "dir/cover.bmp" -> "dir/cover.mod.bmp"; a path without extension gets ".mod".
std::string modified_path(const std::string& path);

} // namespace stegbmp
