#include "openxfer/XferTypes.hpp"

namespace openxfer {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Config:
        return "config";
    case ErrorKind::Auth:
        return "auth";
    case ErrorKind::Connect:
        return "connect";
    case ErrorKind::Protocol:
        return "protocol";
    case ErrorKind::NotFound:
        return "not-found";
    case ErrorKind::BadPattern:
        return "bad-pattern";
    case ErrorKind::ShortWrite:
        return "short-write";
    case ErrorKind::NotImplemented:
        return "not-implemented";
    case ErrorKind::LocalIo:
        return "local-io";
    }
    return "unknown";
}

} // namespace openxfer
