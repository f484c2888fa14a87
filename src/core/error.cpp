#include "core/error.hpp"

namespace stegbmp {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFormat:         return "unsupported format";
        case ErrorKind::MalformedInput:            return "malformed input";
        case ErrorKind::CapacityExceeded:          return "capacity exceeded";
        case ErrorKind::PayloadContainsTerminator: return "payload contains terminator";
        case ErrorKind::TerminatorNotFound:        return "terminator not found";
        case ErrorKind::InvalidEncoding:           return "invalid encoding";
        case ErrorKind::NotAContainer:             return "not a container";
        case ErrorKind::Integrity:                 return "integrity";
        case ErrorKind::UnknownColorModel:         return "unknown color model";
        case ErrorKind::UnsupportedColorModel:     return "unsupported color model";
        case ErrorKind::DecompressionFailed:       return "decompression failed";
        case ErrorKind::Io:                        return "io";
    }
    return "unknown error";
}

} // namespace stegbmp
