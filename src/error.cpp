#include <cstring>

#include "error.hpp"

namespace rgss_vfs {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotExist:
            return "File or directory does not exist";
        case ErrorKind::InvalidHeader:
            return "Archive header is incorrect";
        case ErrorKind::InvalidArchiveVersion:
            return "Invalid archive version";
        case ErrorKind::NotSupported:
            return "Operation not supported by this filesystem";
        case ErrorKind::IO:
            return "IO error";
        case ErrorKind::NoFilesystems:
            return "No filesystems are loaded to perform this operation";
    }
    return "Unknown error";
}

FsError::FsError(ErrorKind kind): std::runtime_error(error_kind_name(kind)), kind_(kind) { }

FsError::FsError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message), kind_(kind) { }

FsError FsError::with_context(const std::string& context) const {
    FsError wrapped(*this);
    static_cast<std::runtime_error&>(wrapped) = std::runtime_error(context + "\n  caused by: " + what());
    return wrapped;
}

FsError io_error(const std::string& what, int errnum) {
    return FsError(ErrorKind::IO, what + ": " + std::strerror(errnum));
}

} // namespace rgss_vfs
