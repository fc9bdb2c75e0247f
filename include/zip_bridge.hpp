#ifndef _ZIP_BRIDGE_HPP
#define _ZIP_BRIDGE_HPP

#include <zip.h>

#include <atomic>
#include <string>
#include <vector>

#include "archive_fs.hpp"
#include "filesystem.hpp"

namespace rgss_vfs {

// Writes every file of `fs` into a new store-mode ZIP at `zip_path`. Entries
// are streamed one at a time while the ZIP is finalized. `progress` is
// incremented once per entry. Returns the number of entries written.
size_t export_zip(FileSystem& fs, const std::string& zip_path, std::atomic<size_t>* progress = nullptr);


// Sequential reader over one entry of an open ZIP.
class ZipEntryFile : public File {
public:
    ZipEntryFile(zip_file_t* file, uint64_t size);
    ~ZipEntryFile() override;

    ZipEntryFile(const ZipEntryFile&) = delete;
    ZipEntryFile& operator=(const ZipEntryFile&) = delete;

    size_t read(char* buf, size_t len) override;
    size_t write(const char* buf, size_t len) override;
    // Only reports the position; compressed entries cannot seek.
    uint64_t seek(int64_t offset, SeekFrom whence) override;
    void flush() override;
    Metadata metadata() const override;
    void set_len(uint64_t new_size) override;

private:
    zip_file_t* file_;
    uint64_t size_;
    uint64_t position_;
};


// Read-only ZIP whose files can be fed to ArchiveFS::from_buffer_and_files.
class ZipReader {
public:
    explicit ZipReader(const std::string& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    // One source per file entry, directories skipped. The reader must
    // outlive the sources, which must be opened one at a time.
    std::vector<ArchiveSource> sources();

private:
    zip_t* zip_;
};

}

#endif
