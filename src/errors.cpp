#include "errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Fetch: return "fetch";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Io: return "io";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}
