#ifndef _ARCHIVE_FS_HPP
#define _ARCHIVE_FS_HPP

#include <atomic>
#include <cinttypes>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "filesystem.hpp"

namespace rgss_vfs {

class ArchiveIndex;

constexpr char kArchiveSignature[7] = {'R', 'G', 'S', 'S', 'A', 'D', '\0'};
constexpr uint32_t kArchiveMagic = 0xDEADCAFE;

// One step of the archive keystream: magic = magic * 7 + 3. Returns the old value.
uint32_t advance_magic(uint32_t& magic);
// Inverse of advance_magic. Returns the old value.
uint32_t regress_magic(uint32_t& magic);

// XOR transform applied to file bodies. Byte k uses byte (k % 4) of the key,
// and the key advances once every four bytes.
class KeyStream {
public:
    explicit KeyStream(uint32_t start_magic);

    void apply(char* data, size_t len);
    // Moves the stream forward by `count` bytes in O(log count).
    void skip(uint64_t count);

    inline uint64_t position() const { return position_; }

private:
    uint32_t magic_;
    uint64_t position_;
};


struct ArchiveEntry {
    uint64_t size;
    uint64_t header_offset;
    uint64_t body_offset;
    uint32_t start_magic;
};


class ArchiveDirectory {
public:
    inline const std::map<std::string, std::unique_ptr<ArchiveDirectory>>& dirs() const { return dirs_; }
    inline const std::map<std::string, ArchiveEntry>& files() const { return files_; }
    inline size_t child_count() const { return dirs_.size() + files_.size(); }

    const ArchiveDirectory* find_dir(const std::string& name) const;
    const ArchiveEntry* find_file(const std::string& name) const;

protected:
    std::map<std::string, std::unique_ptr<ArchiveDirectory>> dirs_;
    std::map<std::string, ArchiveEntry> files_;

    friend ArchiveIndex;
};


// Path-keyed tree of every file in an archive. Directories are implied by the
// file paths; there are no empty directories.
class ArchiveIndex {
public:
    // Returns false if `path` is already present; the first entry wins.
    bool create_file(const std::string& path, const ArchiveEntry& entry);

    const ArchiveDirectory* lookup_dir(const std::string& path) const;
    const ArchiveEntry* lookup_file(const std::string& path) const;

    inline const ArchiveDirectory& root() const { return root_; }
    inline size_t file_count() const { return file_count_; }

protected:
    ArchiveDirectory root_;
    size_t file_count_ = 0;
};


// A file to be written into a new archive. `open` is called once, right
// before the file's body is streamed, and must yield at least `size` bytes.
struct ArchiveSource {
    std::string path;
    uint32_t size;
    std::function<std::unique_ptr<File>()> open;
};


// The single seekable stream under an archive. Its cursor is shared, so every
// read, write or seek happens with `mutex` held.
struct ArchiveStream {
    std::mutex mutex;
    std::unique_ptr<File> file;
};


// A file inside an archive. Decodes lazily on read; writes are only allowed
// within the file's current length.
class ArchiveFile : public File {
public:
    ArchiveFile(std::shared_ptr<ArchiveStream> stream, const ArchiveEntry& entry, bool readable, bool writable);

    size_t read(char* buf, size_t len) override;
    size_t write(const char* buf, size_t len) override;
    uint64_t seek(int64_t offset, SeekFrom whence) override;
    void flush() override;
    Metadata metadata() const override;
    void set_len(uint64_t new_size) override;

private:
    KeyStream& keystream_at(uint64_t position);

    std::shared_ptr<ArchiveStream> stream_;
    ArchiveEntry entry_;
    bool readable_;
    bool writable_;
    uint64_t position_;
    KeyStream keystream_;
};


class ArchiveFS : public FileSystem {
public:
    // Parses the header of an existing archive. Throws FsError with kind
    // InvalidHeader or InvalidArchiveVersion on malformed input.
    explicit ArchiveFS(std::unique_ptr<File> stream);

    // Writes a new archive of the given version into `buffer`, replacing its
    // contents. On failure `buffer` holds an incomplete archive and must be
    // discarded. `progress` is incremented once per file written.
    static std::unique_ptr<ArchiveFS> from_buffer_and_files(std::unique_ptr<File> buffer,
                                                            uint8_t version,
                                                            const std::vector<ArchiveSource>& files,
                                                            std::atomic<size_t>* progress = nullptr);

    // from_buffer_and_files on a worker thread. `progress` must outlive the future.
    static std::future<std::unique_ptr<ArchiveFS>> create_async(std::unique_ptr<File> buffer,
                                                                uint8_t version,
                                                                std::vector<ArchiveSource> files,
                                                                std::atomic<size_t>* progress = nullptr);

    inline uint8_t version() const { return version_; }
    size_t file_count() const;

    std::unique_ptr<File> open_file(const std::string& path, OpenFlags flags) override;
    Metadata metadata(const std::string& path) override;
    bool exists(const std::string& path) override;
    void create_dir(const std::string& path) override;
    void remove_dir(const std::string& path) override;
    void remove_file(const std::string& path) override;
    void rename(const std::string& from, const std::string& to) override;
    std::vector<DirEntry> read_dir(const std::string& path) override;

private:
    ArchiveFS(std::shared_ptr<ArchiveStream> stream, ArchiveIndex index, uint8_t version, uint32_t base_magic);

    void index_v1(uint64_t stream_len);
    void index_v3(uint64_t stream_len);

    std::shared_ptr<ArchiveStream> stream_;
    ArchiveIndex index_;
    mutable std::shared_mutex index_mutex_;
    uint8_t version_;
    uint32_t base_magic_;
};

}

#endif
