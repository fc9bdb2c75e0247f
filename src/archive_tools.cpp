#include <algorithm>
#include <cstdint>

#include "archive_tools.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace rgss_vfs {

namespace {

std::vector<DirEntry> sorted_dir(FileSystem& fs, const std::string& path) {
    auto entries = fs.read_dir(path);
    std::sort(entries.begin(), entries.end(), [](const DirEntry& a, const DirEntry& b) {
        return a.path < b.path;
    });
    return entries;
}

void collect_into(FileSystem& fs, const std::string& dir, const std::string& relative,
                  std::vector<ArchiveSource>& sources) {
    for (const auto& entry : sorted_dir(fs, dir)) {
        std::string name = entry.file_name();
        std::string path = join_path(relative, name);
        std::string real = join_path(dir, name);

        if (!entry.metadata.is_file) {
            collect_into(fs, real, path, sources);
            continue;
        }
        if (entry.metadata.size > UINT32_MAX) {
            throw FsError(ErrorKind::NotSupported, "File " + real + " is too large to be stored in an archive");
        }

        FileSystem* source_fs = &fs;
        sources.push_back(ArchiveSource{path, static_cast<uint32_t>(entry.metadata.size), [source_fs, real]() {
            return source_fs->open_file(real, OpenFlags::Read);
        }});
    }
}

void extract_into(FileSystem& source, FileSystem& dest, const std::string& dir, std::atomic<size_t>* progress) {
    for (const auto& entry : sorted_dir(source, dir)) {
        if (!entry.metadata.is_file) {
            if (!dest.exists(entry.path)) {
                with_context("While creating directory " + entry.path, [&]() { dest.create_dir(entry.path); });
            }
            extract_into(source, dest, entry.path, progress);
            continue;
        }

        with_context("While extracting " + entry.path, [&]() {
            auto input = source.open_file(entry.path, OpenFlags::Read);
            auto output = dest.open_file(entry.path, OpenFlags::Write | OpenFlags::Create | OpenFlags::Truncate);
            copy_stream(*input, *output);
            output->flush();
        });
        if (progress) {
            progress->fetch_add(1);
        }
    }
}

} // namespace

uint64_t copy_stream(File& input, File& output) {
    char chunk[65536];
    uint64_t total = 0;
    size_t n;
    while ((n = input.read(chunk, sizeof(chunk))) > 0) {
        output.write_all(chunk, n);
        total += n;
    }
    return total;
}

std::vector<ArchiveSource> collect_sources(FileSystem& fs, const std::string& root) {
    std::vector<ArchiveSource> sources;
    collect_into(fs, normalize_path(root), "", sources);
    return sources;
}

void extract_all(FileSystem& source, FileSystem& dest, std::atomic<size_t>* progress) {
    extract_into(source, dest, "", progress);
}

std::future<void> extract_async(FileSystem& source, FileSystem& dest, std::atomic<size_t>* progress) {
    return std::async(std::launch::async, [&source, &dest, progress]() {
        extract_all(source, dest, progress);
    });
}

}
