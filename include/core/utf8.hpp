#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stegbmp {

// Returns the offset of the first byte that breaks UTF-8 well-formedness,
// or bytes.size() if the whole buffer is valid.
size_t utf8_error_offset(const std::vector<uint8_t>& bytes);

inline bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
    return utf8_error_offset(bytes) == bytes.size();
}

} // namespace stegbmp
