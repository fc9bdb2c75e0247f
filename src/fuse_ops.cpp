#include <cstring>
#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <iostream>
#include <mutex>

#include "fuse_ops.hpp"
#include "error.hpp"

namespace rgss_vfs {

namespace {

struct FileHandle {
    std::mutex mutex;
    std::unique_ptr<File> file;
};

int to_errno(const FsError& e) {
    switch (e.kind()) {
        case ErrorKind::NotExist:
            return -ENOENT;
        case ErrorKind::NotSupported:
            return -ENOTSUP;
        case ErrorKind::NoFilesystems:
            return -ENODEV;
        default:
            return -EIO;
    }
}

// Runs `f` and reports any error as a negative errno. Unexpected failures are logged.
template<typename F>
int guarded(const char* op, const char* path, F&& f) {
    try {
        return f();
    } catch (const FsError& e) {
        int err = to_errno(e);
        if (err == -EIO) {
            std::cerr << op << " " << path << ": " << e.what() << std::endl;
        }
        return err;
    } catch (const std::exception& e) {
        std::cerr << op << " " << path << ": " << e.what() << std::endl;
        return -EIO;
    }
}

OpenFlags open_flags(int flags) {
    OpenFlags result = OpenFlags::None;
    switch (flags & O_ACCMODE) {
        case O_WRONLY:
            result = OpenFlags::Write;
            break;
        case O_RDWR:
            result = OpenFlags::Read | OpenFlags::Write;
            break;
        default:
            result = OpenFlags::Read;
            break;
    }
    if (flags & O_TRUNC) {
        result = result | OpenFlags::Truncate;
    }
    return result;
}

inline FileHandle* get_handle(struct fuse_file_info *fi) {
    return reinterpret_cast<FileHandle*>(fi->fh);
}

int open_handle(const char *path, OpenFlags flags, struct fuse_file_info *fi) {
    auto handle = std::make_unique<FileHandle>();
    handle->file = MountState::get_instance().filesystem().open_file(path, flags);
    static_assert(sizeof(fi->fh) >= sizeof(FileHandle*), "fh must hold a pointer");
    fi->fh = reinterpret_cast<uintptr_t>(handle.release());
    return 0;
}

} // namespace

void* vfs_init(struct fuse_conn_info *conn, struct fuse_config *cfg) {
    if (conn->capable & FUSE_CAP_ASYNC_READ) {
        conn->want |= FUSE_CAP_ASYNC_READ;
        std::cerr << "Enabled FUSE_CAP_ASYNC_READ" << std::endl;
    }

    if (conn->capable & FUSE_CAP_PARALLEL_DIROPS) {
        conn->want |= FUSE_CAP_PARALLEL_DIROPS;
        std::cerr << "Enabled FUSE_CAP_PARALLEL_DIROPS" << std::endl;
    }

    cfg->kernel_cache = 0;
    cfg->use_ino = 0;
    cfg->nullpath_ok = 0;
    cfg->direct_io = 0;

    std::cerr << "FUSE filesystem initialized" << std::endl;
    return nullptr;
}

void vfs_destroy(void *private_data) {
    (void) private_data;
    std::cerr << "FUSE filesystem shutting down" << std::endl;
}

int vfs_getattr(const char *path, struct stat *stbuf, struct fuse_file_info *fi) {
    (void) fi;

    memset(stbuf, 0, sizeof(struct stat));

    return guarded("getattr", path, [&]() {
        Metadata metadata = MountState::get_instance().filesystem().metadata(path);
        if (metadata.is_file) {
            stbuf->st_mode = S_IFREG | 0644;
            stbuf->st_nlink = 1;
            stbuf->st_size = static_cast<off_t>(metadata.size);
        } else {
            stbuf->st_mode = S_IFDIR | 0755;
            stbuf->st_nlink = 2;
            stbuf->st_size = 4096;
        }
        return 0;
    });
}

int vfs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                off_t offset, struct fuse_file_info *fi,
                enum fuse_readdir_flags flags) {
    (void) offset;
    (void) fi;
    (void) flags;

    return guarded("readdir", path, [&]() {
        auto entries = MountState::get_instance().filesystem().read_dir(path);

        filler(buf, ".", nullptr, 0, (fuse_fill_dir_flags)0);
        filler(buf, "..", nullptr, 0, (fuse_fill_dir_flags)0);

        for (const auto& entry : entries) {
            filler(buf, entry.file_name().c_str(), nullptr, 0, (fuse_fill_dir_flags)0);
        }
        return 0;
    });
}

int vfs_open(const char *path, struct fuse_file_info *fi) {
    return guarded("open", path, [&]() {
        return open_handle(path, open_flags(fi->flags), fi);
    });
}

int vfs_create(const char *path, mode_t mode, struct fuse_file_info *fi) {
    (void) mode;

    return guarded("create", path, [&]() {
        return open_handle(path, open_flags(fi->flags) | OpenFlags::Create, fi);
    });
}

int vfs_read(const char *path, char *buf, size_t size, off_t offset,
             struct fuse_file_info *fi) {
    FileHandle* handle = get_handle(fi);

    return guarded("read", path, [&]() {
        std::lock_guard<std::mutex> lock(handle->mutex);
        handle->file->seek(offset, SeekFrom::Start);

        size_t done = 0;
        while (done < size) {
            size_t n = handle->file->read(buf + done, size - done);
            if (n == 0) {
                break;
            }
            done += n;
        }
        return static_cast<int>(done);
    });
}

int vfs_write(const char *path, const char *buf, size_t size, off_t offset,
              struct fuse_file_info *fi) {
    FileHandle* handle = get_handle(fi);

    return guarded("write", path, [&]() {
        std::lock_guard<std::mutex> lock(handle->mutex);
        handle->file->seek(offset, SeekFrom::Start);
        handle->file->write_all(buf, size);
        return static_cast<int>(size);
    });
}

int vfs_truncate(const char *path, off_t size, struct fuse_file_info *fi) {
    return guarded("truncate", path, [&]() {
        if (fi) {
            FileHandle* handle = get_handle(fi);
            std::lock_guard<std::mutex> lock(handle->mutex);
            handle->file->set_len(static_cast<uint64_t>(size));
            return 0;
        }
        auto file = MountState::get_instance().filesystem().open_file(path, OpenFlags::Write);
        file->set_len(static_cast<uint64_t>(size));
        return 0;
    });
}

int vfs_flush(const char *path, struct fuse_file_info *fi) {
    FileHandle* handle = get_handle(fi);

    return guarded("flush", path, [&]() {
        std::lock_guard<std::mutex> lock(handle->mutex);
        handle->file->flush();
        return 0;
    });
}

int vfs_release(const char *path, struct fuse_file_info *fi) {
    (void) path;
    delete get_handle(fi);
    fi->fh = 0;
    return 0;
}

int vfs_mkdir(const char *path, mode_t mode) {
    (void) mode;

    return guarded("mkdir", path, [&]() {
        MountState::get_instance().filesystem().create_dir(path);
        return 0;
    });
}

int vfs_unlink(const char *path) {
    return guarded("unlink", path, [&]() {
        MountState::get_instance().filesystem().remove_file(path);
        return 0;
    });
}

int vfs_rmdir(const char *path) {
    return guarded("rmdir", path, [&]() {
        MountState::get_instance().filesystem().remove_dir(path);
        return 0;
    });
}

int vfs_rename(const char *from, const char *to, unsigned int flags) {
    if (flags != 0) {
        return -EINVAL;
    }

    return guarded("rename", from, [&]() {
        MountState::get_instance().filesystem().rename(from, to);
        return 0;
    });
}

struct fuse_operations* get_vfs_operations() {
    static struct fuse_operations ops = {};

    ops.init = vfs_init;
    ops.destroy = vfs_destroy;
    ops.getattr = vfs_getattr;
    ops.readdir = vfs_readdir;
    ops.open = vfs_open;
    ops.create = vfs_create;
    ops.read = vfs_read;
    ops.write = vfs_write;
    ops.truncate = vfs_truncate;
    ops.flush = vfs_flush;
    ops.release = vfs_release;
    ops.mkdir = vfs_mkdir;
    ops.unlink = vfs_unlink;
    ops.rmdir = vfs_rmdir;
    ops.rename = vfs_rename;

    return &ops;
}

} // namespace rgss_vfs
