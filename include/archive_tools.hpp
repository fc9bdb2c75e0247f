#ifndef _ARCHIVE_TOOLS_HPP
#define _ARCHIVE_TOOLS_HPP

#include <atomic>
#include <future>
#include <string>
#include <vector>

#include "archive_fs.hpp"
#include "filesystem.hpp"

namespace rgss_vfs {

// Every file below `root` in `fs`, in path order, with paths relative to
// `root`. The sources open their files from `fs`, which must outlive them.
std::vector<ArchiveSource> collect_sources(FileSystem& fs, const std::string& root = "");

// Copies every file and directory of `source` into `dest`. `progress` is
// incremented once per file copied.
void extract_all(FileSystem& source, FileSystem& dest, std::atomic<size_t>* progress = nullptr);

// extract_all on a worker thread. Both filesystems and `progress` must
// outlive the future.
std::future<void> extract_async(FileSystem& source, FileSystem& dest, std::atomic<size_t>* progress = nullptr);

// Copies the rest of `input` to `output`. Returns the number of bytes copied.
uint64_t copy_stream(File& input, File& output);

}

#endif
