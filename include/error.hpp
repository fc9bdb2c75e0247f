#ifndef _ERROR_HPP
#define _ERROR_HPP

#include <stdexcept>
#include <string>

namespace rgss_vfs {

enum class ErrorKind {
    NotExist,
    InvalidHeader,
    InvalidArchiveVersion,
    NotSupported,
    IO,
    NoFilesystems,
};

const char* error_kind_name(ErrorKind kind);

// Every backend reports failures with this exception. Context added on the
// way up only changes the message, never the kind.
class FsError : public std::runtime_error {
public:
    explicit FsError(ErrorKind kind);
    FsError(ErrorKind kind, const std::string& message);

    inline ErrorKind kind() const { return kind_; }

    FsError with_context(const std::string& context) const;

private:
    ErrorKind kind_;
};

// IO error carrying strerror(errnum).
FsError io_error(const std::string& what, int errnum);

// Runs `f`, re-throwing any FsError with `context` prepended.
template<typename F>
auto with_context(const std::string& context, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const FsError& e) {
        throw e.with_context(context);
    }
}

}

#endif
