#ifndef _PATH_CACHE_FS_HPP
#define _PATH_CACHE_FS_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "filesystem.hpp"

namespace rgss_vfs {

// One real-cased path component. `next` points at the parent component, so
// nodes for a shared prefix are shared by every path below it.
struct CactusNode {
    std::string value;
    std::optional<size_t> next;
    size_t len;
    bool is_file;
};


// Slab of cactus nodes addressed by stable index. Freed slots are reused.
class CactusStore {
public:
    size_t insert(CactusNode node);
    void remove(size_t index);
    void clear();

    inline const CactusNode& get(size_t index) const { return *nodes_[index]; }
    inline size_t size() const { return live_; }

    // Joins the chain ending at `index` from the root down.
    std::string path(size_t index) const;

private:
    std::vector<std::optional<CactusNode>> nodes_;
    std::vector<size_t> free_;
    size_t live_ = 0;
};


// Case-insensitive memo from lowered paths to real paths.
//
// The trie maps "<lowered parent>/<lowered stem>" to a map from lowered
// extension to a cactus index. Lowered parents use the full component names,
// extensions included. Entries are only added for directories that were
// actually listed.
class PathCache {
public:
    // Exact lookup, then any extension for the same name. "" is the root.
    std::optional<std::string> desensitize(const std::string& path) const;

    // Caches `path`, listing only the directories below the longest prefix
    // that is already known. A no-op when `path` already resolves.
    void regen(FileSystem& fs, const std::string& path);
    // Like regen, but a glob match on another extension does not count as
    // cached. Used to absorb an entry that was just created.
    void regen_exact(FileSystem& fs, const std::string& path);

    // Real path for creating `path`: the longest cached prefix followed by the
    // remaining components as given.
    std::string resolve_for_create(const std::string& path) const;

    // Drops `real_path` and everything below it.
    void purge(const std::string& real_path);

    void clear();
    inline size_t size() const { return store_.size(); }

private:
    using ExtensionMap = std::map<std::string, size_t>;

    std::optional<size_t> lookup_exact(const std::vector<std::string>& lowered, size_t count) const;
    std::optional<size_t> lookup(const std::vector<std::string>& lowered) const;
    size_t insert(const std::string& parent_key, std::optional<size_t> parent, const std::string& name, bool is_file);
    bool clone_ext_sibling(FileSystem& fs, const std::vector<std::string>& components,
                           const std::vector<std::string>& lowered);

    std::map<std::string, ExtensionMap> trie_;
    CactusStore store_;
};


// Wraps a filesystem with case-insensitive, extension-fuzzy path resolution.
class PathCacheFS : public FileSystem {
public:
    explicit PathCacheFS(std::unique_ptr<FileSystem> fs);

    // Real path of `path`, regenerating the cache as needed. Returns nullopt
    // if nothing on the backend matches.
    std::optional<std::string> desensitize(const std::string& path);
    // Forgets every cached path.
    void rebuild();
    size_t cached_path_count() const;

    inline FileSystem& inner() { return *fs_; }

    std::unique_ptr<File> open_file(const std::string& path, OpenFlags flags) override;
    Metadata metadata(const std::string& path) override;
    bool exists(const std::string& path) override;
    void create_dir(const std::string& path) override;
    void remove_dir(const std::string& path) override;
    void remove_file(const std::string& path) override;
    void rename(const std::string& from, const std::string& to) override;
    std::vector<DirEntry> read_dir(const std::string& path) override;

private:
    // Both expect `mutex_` to be held exclusively.
    std::string resolve(const std::string& path);
    std::string resolve_for_create(const std::string& path);

    std::unique_ptr<FileSystem> fs_;
    PathCache cache_;
    mutable std::shared_mutex mutex_;
};

}

#endif
