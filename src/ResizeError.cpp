#include "imgresize/ResizeError.hpp"

namespace imgresize {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::DecodeError:
            return "DecodeError";
        case ErrorKind::IOError:
            return "IOError";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::Other:
            return "Other";
    }
    return "Other";
}

} // namespace imgresize
