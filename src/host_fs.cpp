#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "host_fs.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace rgss_vfs {

namespace {

FsError fs_error(const std::string& what, const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) {
        return FsError(ErrorKind::NotExist, what);
    }
    return FsError(ErrorKind::IO, what + ": " + ec.message());
}

} // namespace

HostFile::HostFile(int fd): fd_(fd) { }

HostFile::~HostFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<HostFile> HostFile::open(const std::filesystem::path& path, OpenFlags flags) {
    int oflags = 0;
    bool readable = has_flag(flags, OpenFlags::Read);
    bool writable = has_flag(flags, OpenFlags::Write) || has_flag(flags, OpenFlags::Truncate) ||
                    has_flag(flags, OpenFlags::Create);

    if (readable && writable) {
        oflags = O_RDWR;
    } else if (writable) {
        oflags = O_WRONLY;
    } else {
        oflags = O_RDONLY;
    }
    if (has_flag(flags, OpenFlags::Create)) {
        oflags |= O_CREAT;
    }
    if (has_flag(flags, OpenFlags::Truncate)) {
        oflags |= O_TRUNC;
    }
    oflags |= O_CLOEXEC;

    int fd = ::open(path.c_str(), oflags, 0644);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) {
            throw FsError(ErrorKind::NotExist, path.string());
        }
        throw io_error("Failed to open " + path.string(), err);
    }
    return std::make_unique<HostFile>(fd);
}

std::unique_ptr<HostFile> HostFile::temporary() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    std::string tmpl = (dir / "rgss_vfs.XXXXXX").string();

    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        throw io_error("Failed to create a temporary file in " + dir.string(), errno);
    }
    ::unlink(tmpl.c_str());
    return std::make_unique<HostFile>(fd);
}

size_t HostFile::read(char* buf, size_t len) {
    while (true) {
        ssize_t n = ::read(fd_, buf, len);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw io_error("Failed to read", errno);
        }
    }
}

size_t HostFile::write(const char* buf, size_t len) {
    while (true) {
        ssize_t n = ::write(fd_, buf, len);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw io_error("Failed to write", errno);
        }
    }
}

uint64_t HostFile::seek(int64_t offset, SeekFrom whence) {
    int w = SEEK_SET;
    if (whence == SeekFrom::Current) {
        w = SEEK_CUR;
    } else if (whence == SeekFrom::End) {
        w = SEEK_END;
    }
    off_t pos = ::lseek(fd_, static_cast<off_t>(offset), w);
    if (pos < 0) {
        throw io_error("Failed to seek", errno);
    }
    return static_cast<uint64_t>(pos);
}

void HostFile::flush() {
    // Writes go straight to the descriptor; nothing is buffered in user space.
}

Metadata HostFile::metadata() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw io_error("Failed to stat", errno);
    }
    return Metadata{S_ISREG(st.st_mode), static_cast<uint64_t>(st.st_size)};
}

void HostFile::set_len(uint64_t new_size) {
    if (::ftruncate(fd_, static_cast<off_t>(new_size)) != 0) {
        throw io_error("Failed to set file length", errno);
    }
}


HostFS::HostFS(const std::filesystem::path& root): root_(root) { }

std::filesystem::path HostFS::resolve(const std::string& path) const {
    std::string normalized = normalize_path(path);
    if (normalized.empty()) {
        return root_;
    }
    return root_ / normalized;
}

std::unique_ptr<File> HostFS::open_file(const std::string& path, OpenFlags flags) {
    return HostFile::open(resolve(path), flags);
}

Metadata HostFS::metadata(const std::string& path) {
    auto full = resolve(path);
    std::error_code ec;
    auto status = std::filesystem::status(full, ec);
    if (ec) {
        throw fs_error(path, ec);
    }
    if (status.type() == std::filesystem::file_type::not_found) {
        throw FsError(ErrorKind::NotExist, path);
    }
    if (std::filesystem::is_regular_file(status)) {
        auto size = std::filesystem::file_size(full, ec);
        if (ec) {
            throw fs_error(path, ec);
        }
        return Metadata{true, static_cast<uint64_t>(size)};
    }
    return Metadata{false, 0};
}

bool HostFS::exists(const std::string& path) {
    std::error_code ec;
    bool found = std::filesystem::exists(resolve(path), ec);
    if (ec && ec != std::errc::not_a_directory) {
        throw fs_error(path, ec);
    }
    return found;
}

void HostFS::create_dir(const std::string& path) {
    std::error_code ec;
    bool created = std::filesystem::create_directory(resolve(path), ec);
    if (ec) {
        throw fs_error("Failed to create directory " + path, ec);
    }
    if (!created) {
        throw io_error("Failed to create directory " + path, EEXIST);
    }
}

void HostFS::remove_dir(const std::string& path) {
    if (metadata(path).is_file) {
        throw io_error("Failed to remove directory " + path, ENOTDIR);
    }
    std::error_code ec;
    std::filesystem::remove_all(resolve(path), ec);
    if (ec) {
        throw fs_error("Failed to remove directory " + path, ec);
    }
}

void HostFS::remove_file(const std::string& path) {
    if (!metadata(path).is_file) {
        throw io_error("Failed to remove file " + path, EISDIR);
    }
    std::error_code ec;
    std::filesystem::remove(resolve(path), ec);
    if (ec) {
        throw fs_error("Failed to remove file " + path, ec);
    }
}

void HostFS::rename(const std::string& from, const std::string& to) {
    std::error_code ec;
    std::filesystem::rename(resolve(from), resolve(to), ec);
    if (ec) {
        throw fs_error("Failed to rename " + from + " to " + to, ec);
    }
}

std::vector<DirEntry> HostFS::read_dir(const std::string& path) {
    std::string base = normalize_path(path);
    std::error_code ec;
    std::filesystem::directory_iterator it(resolve(path), ec);
    if (ec) {
        throw fs_error("Failed to read directory " + path, ec);
    }

    std::vector<DirEntry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        bool is_file = entry.is_regular_file(ec);
        uint64_t size = 0;
        if (is_file) {
            size = entry.file_size(ec);
        }
        if (ec) {
            throw fs_error("Failed to read directory entry " + entry.path().string(), ec);
        }
        entries.push_back(DirEntry{join_path(base, entry.path().filename().string()), Metadata{is_file, size}});
    }
    if (ec) {
        throw fs_error("Failed to read directory " + path, ec);
    }
    return entries;
}

} // namespace rgss_vfs
