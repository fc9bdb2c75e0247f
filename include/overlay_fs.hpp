#ifndef _OVERLAY_FS_HPP
#define _OVERLAY_FS_HPP

#include <memory>
#include <string>
#include <vector>

#include "filesystem.hpp"

namespace rgss_vfs {

// Priority-ordered stack of filesystems. Reads go to the first layer that has
// the path; writes only ever go to layer 0.
class OverlayFS : public FileSystem {
public:
    OverlayFS() = default;

    // Layers are appended once and never reordered. Earlier layers win.
    void push_layer(std::unique_ptr<FileSystem> layer);
    inline size_t layer_count() const { return layers_.size(); }

    std::unique_ptr<File> open_file(const std::string& path, OpenFlags flags) override;
    Metadata metadata(const std::string& path) override;
    bool exists(const std::string& path) override;
    void create_dir(const std::string& path) override;
    void remove_dir(const std::string& path) override;
    void remove_file(const std::string& path) override;
    void rename(const std::string& from, const std::string& to) override;
    // Merged listing of every layer; a name from an earlier layer hides the
    // same name in later ones.
    std::vector<DirEntry> read_dir(const std::string& path) override;

private:
    FileSystem& top_layer();
    // First layer where `path` exists, or nullptr.
    FileSystem* find_layer(const std::string& path);

    std::vector<std::unique_ptr<FileSystem>> layers_;
};

}

#endif
