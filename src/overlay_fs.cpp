#include <set>

#include "overlay_fs.hpp"
#include "error.hpp"

namespace rgss_vfs {

void OverlayFS::push_layer(std::unique_ptr<FileSystem> layer) {
    layers_.push_back(std::move(layer));
}

FileSystem& OverlayFS::top_layer() {
    if (layers_.empty()) {
        throw FsError(ErrorKind::NoFilesystems);
    }
    return *layers_.front();
}

FileSystem* OverlayFS::find_layer(const std::string& path) {
    if (layers_.empty()) {
        throw FsError(ErrorKind::NoFilesystems);
    }
    for (auto& layer : layers_) {
        if (layer->exists(path)) {
            return layer.get();
        }
    }
    return nullptr;
}

std::unique_ptr<File> OverlayFS::open_file(const std::string& path, OpenFlags flags) {
    if (has_flag(flags, OpenFlags::Write) || has_flag(flags, OpenFlags::Create) ||
        has_flag(flags, OpenFlags::Truncate)) {
        return top_layer().open_file(path, flags);
    }

    FileSystem* layer = find_layer(path);
    if (!layer) {
        throw FsError(ErrorKind::NotExist, path);
    }
    return layer->open_file(path, flags);
}

Metadata OverlayFS::metadata(const std::string& path) {
    FileSystem* layer = find_layer(path);
    if (!layer) {
        throw FsError(ErrorKind::NotExist, path);
    }
    return layer->metadata(path);
}

bool OverlayFS::exists(const std::string& path) {
    return find_layer(path) != nullptr;
}

void OverlayFS::create_dir(const std::string& path) {
    top_layer().create_dir(path);
}

void OverlayFS::remove_dir(const std::string& path) {
    top_layer().remove_dir(path);
}

void OverlayFS::remove_file(const std::string& path) {
    top_layer().remove_file(path);
}

void OverlayFS::rename(const std::string& from, const std::string& to) {
    top_layer().rename(from, to);
}

std::vector<DirEntry> OverlayFS::read_dir(const std::string& path) {
    if (layers_.empty()) {
        throw FsError(ErrorKind::NoFilesystems);
    }

    std::vector<DirEntry> entries;
    std::set<std::string> seen;
    bool found = false;

    for (auto& layer : layers_) {
        if (!layer->exists(path) || layer->metadata(path).is_file) {
            continue;
        }
        found = true;
        for (auto& entry : layer->read_dir(path)) {
            if (seen.insert(entry.file_name()).second) {
                entries.push_back(std::move(entry));
            }
        }
    }

    if (!found) {
        throw FsError(ErrorKind::NotExist, path);
    }
    return entries;
}

} // namespace rgss_vfs
