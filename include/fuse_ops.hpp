#ifndef _FUSE_OPS_HPP
#define _FUSE_OPS_HPP

#define FUSE_USE_VERSION 31

#include <fuse3/fuse.h>

#include <memory>

#include "filesystem.hpp"
#include "utils.hpp"

namespace rgss_vfs {

// The filesystem served by the FUSE callbacks.
class MountStateImpl {
public:
    inline void set_filesystem(std::unique_ptr<FileSystem> fs) { fs_ = std::move(fs); }
    inline FileSystem& filesystem() { return *fs_; }

protected:
    std::unique_ptr<FileSystem> fs_;
};

typedef Singleton<MountStateImpl> MountState;

// FUSE operation callbacks
void* vfs_init(struct fuse_conn_info *conn, struct fuse_config *cfg);
void vfs_destroy(void *private_data);
int vfs_getattr(const char *path, struct stat *stbuf, struct fuse_file_info *fi);
int vfs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                off_t offset, struct fuse_file_info *fi,
                enum fuse_readdir_flags flags);
int vfs_open(const char *path, struct fuse_file_info *fi);
int vfs_create(const char *path, mode_t mode, struct fuse_file_info *fi);
int vfs_read(const char *path, char *buf, size_t size, off_t offset,
             struct fuse_file_info *fi);
int vfs_write(const char *path, const char *buf, size_t size, off_t offset,
              struct fuse_file_info *fi);
int vfs_truncate(const char *path, off_t size, struct fuse_file_info *fi);
int vfs_flush(const char *path, struct fuse_file_info *fi);
int vfs_release(const char *path, struct fuse_file_info *fi);
int vfs_mkdir(const char *path, mode_t mode);
int vfs_unlink(const char *path);
int vfs_rmdir(const char *path);
int vfs_rename(const char *from, const char *to, unsigned int flags);

// Get FUSE operations structure
struct fuse_operations* get_vfs_operations();

} // namespace rgss_vfs

#endif
