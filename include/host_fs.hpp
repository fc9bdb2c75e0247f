#ifndef _HOST_FS_HPP
#define _HOST_FS_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "filesystem.hpp"

namespace rgss_vfs {

// File backed by a POSIX descriptor. Owns and closes the descriptor.
class HostFile : public File {
public:
    explicit HostFile(int fd);
    ~HostFile() override;

    HostFile(const HostFile&) = delete;
    HostFile& operator=(const HostFile&) = delete;

    static std::unique_ptr<HostFile> open(const std::filesystem::path& path, OpenFlags flags);
    // Anonymous read/write scratch file, removed from the directory tree on creation.
    static std::unique_ptr<HostFile> temporary();

    size_t read(char* buf, size_t len) override;
    size_t write(const char* buf, size_t len) override;
    uint64_t seek(int64_t offset, SeekFrom whence) override;
    void flush() override;
    Metadata metadata() const override;
    void set_len(uint64_t new_size) override;

private:
    int fd_;
};


// Directory on the host disk. All paths are relative to `root`.
class HostFS : public FileSystem {
public:
    explicit HostFS(const std::filesystem::path& root);

    inline const std::filesystem::path& root_path() const { return root_; }

    std::unique_ptr<File> open_file(const std::string& path, OpenFlags flags) override;
    Metadata metadata(const std::string& path) override;
    bool exists(const std::string& path) override;
    void create_dir(const std::string& path) override;
    void remove_dir(const std::string& path) override;
    void remove_file(const std::string& path) override;
    void rename(const std::string& from, const std::string& to) override;
    std::vector<DirEntry> read_dir(const std::string& path) override;

private:
    std::filesystem::path resolve(const std::string& path) const;

    std::filesystem::path root_;
};

}

#endif
