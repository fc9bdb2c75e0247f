#ifndef _FILESYSTEM_HPP
#define _FILESYSTEM_HPP

#include <cinttypes>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace rgss_vfs {

struct Metadata {
    bool is_file;
    uint64_t size;
};

struct DirEntry {
    std::string path;
    Metadata metadata;

    std::string file_name() const;
};

enum class OpenFlags : uint8_t {
    None = 0,
    Read = 0b0001,
    Write = 0b0010,
    Truncate = 0b0100,
    Create = 0b1000,
};

inline OpenFlags operator|(OpenFlags a, OpenFlags b) {
    return static_cast<OpenFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_flag(OpenFlags flags, OpenFlags flag) {
    return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

enum class SeekFrom {
    Start,
    Current,
    End,
};

class File {
public:
    virtual ~File() = default;

    // Returns the number of bytes read; 0 means end of file.
    virtual size_t read(char* buf, size_t len) = 0;
    virtual size_t write(const char* buf, size_t len) = 0;
    // Returns the new position from the start of the file.
    virtual uint64_t seek(int64_t offset, SeekFrom whence) = 0;
    virtual void flush() = 0;
    virtual Metadata metadata() const = 0;
    virtual void set_len(uint64_t new_size) = 0;

    void read_exact(char* buf, size_t len);
    void write_all(const char* buf, size_t len);
    uint64_t stream_position();
    std::vector<char> read_to_end();

    // Reads on a worker thread. The file and the buffer must outlive the future.
    std::future<size_t> read_async(char* buf, size_t len);
};

// The storage contract every backend and every layer implements.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual std::unique_ptr<File> open_file(const std::string& path, OpenFlags flags) = 0;
    virtual Metadata metadata(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;
    virtual void create_dir(const std::string& path) = 0;
    virtual void remove_dir(const std::string& path) = 0;
    virtual void remove_file(const std::string& path) = 0;
    virtual void rename(const std::string& from, const std::string& to) = 0;
    virtual std::vector<DirEntry> read_dir(const std::string& path) = 0;

    std::unique_ptr<File> create_file(const std::string& path);
    // Removes a file or a directory tree depending on what `path` is.
    void remove(const std::string& path);
    std::vector<char> read(const std::string& path);
    std::string read_to_string(const std::string& path);
    // Creates or truncates `path` and writes `len` bytes to it.
    void write(const std::string& path, const char* data, size_t len);
    void write(const std::string& path, const std::string& data);
};

}

#endif
