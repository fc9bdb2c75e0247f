#include <mutex>

#include "path_cache_fs.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace rgss_vfs {

namespace {

// Trie key and extension of the first `count` lowered components.
std::pair<std::string, std::string> trie_key(const std::vector<std::string>& lowered, size_t count) {
    auto stem_ext = split_extension(lowered[count - 1]);
    return {join_path(join_components(lowered, 0, count - 1), stem_ext.first), stem_ext.second};
}

} // namespace

size_t CactusStore::insert(CactusNode node) {
    live_++;
    if (!free_.empty()) {
        size_t index = free_.back();
        free_.pop_back();
        nodes_[index] = std::move(node);
        return index;
    }
    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

void CactusStore::remove(size_t index) {
    if (index < nodes_.size() && nodes_[index]) {
        nodes_[index].reset();
        free_.push_back(index);
        live_--;
    }
}

void CactusStore::clear() {
    nodes_.clear();
    free_.clear();
    live_ = 0;
}

std::string CactusStore::path(size_t index) const {
    std::vector<const std::string*> parts;
    parts.reserve(get(index).len);

    std::optional<size_t> current = index;
    while (current) {
        const CactusNode& node = get(*current);
        parts.push_back(&node.value);
        current = node.next;
    }

    std::string joined;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!joined.empty()) {
            joined.push_back('/');
        }
        joined += **it;
    }
    return joined;
}


std::optional<size_t> PathCache::lookup_exact(const std::vector<std::string>& lowered, size_t count) const {
    auto key = trie_key(lowered, count);
    auto it = trie_.find(key.first);
    if (it == trie_.end()) {
        return std::nullopt;
    }
    auto ext_it = it->second.find(key.second);
    if (ext_it == it->second.end()) {
        return std::nullopt;
    }
    return ext_it->second;
}

std::optional<size_t> PathCache::lookup(const std::vector<std::string>& lowered) const {
    if (auto index = lookup_exact(lowered, lowered.size())) {
        return index;
    }

    // "name" also matches "name.<any extension>"
    auto it = trie_.find(join_components(lowered, 0, lowered.size()));
    if (it != trie_.end() && !it->second.empty()) {
        return it->second.begin()->second;
    }
    return std::nullopt;
}

size_t PathCache::insert(const std::string& parent_key, std::optional<size_t> parent,
                         const std::string& name, bool is_file) {
    auto stem_ext = split_extension(to_lowercase(name));
    auto& extensions = trie_[join_path(parent_key, stem_ext.first)];

    auto it = extensions.find(stem_ext.second);
    if (it != extensions.end()) {
        return it->second;
    }

    size_t len = parent ? store_.get(*parent).len + 1 : 1;
    size_t index = store_.insert(CactusNode{name, parent, len, is_file});
    extensions.emplace(stem_ext.second, index);
    return index;
}

bool PathCache::clone_ext_sibling(FileSystem& fs, const std::vector<std::string>& components,
                                  const std::vector<std::string>& lowered) {
    auto key = trie_key(lowered, lowered.size());
    auto it = trie_.find(key.first);
    if (it == trie_.end() || it->second.empty()) {
        return false;
    }

    const CactusNode& sibling = store_.get(it->second.begin()->second);
    std::optional<size_t> parent = sibling.next;
    size_t len = sibling.len;

    std::string name = split_extension(sibling.value).first;
    std::string extension = split_extension(components.back()).second;
    if (!extension.empty()) {
        name += "." + extension;
    }

    std::string real = join_path(parent ? store_.path(*parent) : "", name);
    if (!fs.exists(real)) {
        return false;
    }
    bool is_file = fs.metadata(real).is_file;

    size_t index = store_.insert(CactusNode{name, parent, len, is_file});
    trie_[key.first].emplace(key.second, index);
    return true;
}

std::optional<std::string> PathCache::desensitize(const std::string& path) const {
    auto lowered = split_components(to_lowercase(path));
    if (lowered.empty()) {
        return std::string();
    }

    auto index = lookup(lowered);
    if (!index) {
        return std::nullopt;
    }
    return store_.path(*index);
}

void PathCache::regen(FileSystem& fs, const std::string& path) {
    auto lowered = split_components(to_lowercase(path));
    if (!lowered.empty() && lookup(lowered)) {
        return;
    }
    regen_exact(fs, path);
}

void PathCache::regen_exact(FileSystem& fs, const std::string& path) {
    auto components = split_components(path);
    auto lowered = split_components(to_lowercase(path));
    if (lowered.empty() || lookup_exact(lowered, lowered.size())) {
        return;
    }

    if (clone_ext_sibling(fs, components, lowered)) {
        return;
    }

    // Longest prefix that is already cached
    size_t depth = 0;
    std::optional<size_t> parent;
    for (size_t i = lowered.size() - 1; i > 0; i--) {
        if (auto index = lookup_exact(lowered, i)) {
            depth = i;
            parent = index;
            break;
        }
    }

    std::string real = parent ? store_.path(*parent) : "";
    for (size_t i = depth; i < lowered.size(); i++) {
        if (parent && store_.get(*parent).is_file) {
            return;
        }

        auto entries = with_context("While regenerating cache for path " + path, [&]() {
            return fs.read_dir(real);
        });

        // Every sibling goes into the cache, not only the one being looked for.
        std::string parent_key = join_components(lowered, 0, i);
        std::optional<size_t> matched;
        for (const auto& entry : entries) {
            std::string name = entry.file_name();
            size_t index = insert(parent_key, parent, name, entry.metadata.is_file);
            if (!matched && to_lowercase(name) == lowered[i]) {
                matched = index;
            }
        }

        if (!matched) {
            return;
        }
        parent = matched;
        real = join_path(real, store_.get(*matched).value);
    }
}

std::string PathCache::resolve_for_create(const std::string& path) const {
    auto components = split_components(path);
    auto lowered = split_components(to_lowercase(path));

    for (size_t i = lowered.size(); i > 0; i--) {
        if (auto index = lookup_exact(lowered, i)) {
            return join_path(store_.path(*index), join_components(components, i, components.size()));
        }
    }
    return join_components(components, 0, components.size());
}

void PathCache::purge(const std::string& real_path) {
    auto lowered = split_components(to_lowercase(real_path));
    if (lowered.empty()) {
        clear();
        return;
    }

    auto key = trie_key(lowered, lowered.size());
    auto it = trie_.find(key.first);
    if (it != trie_.end()) {
        auto ext_it = it->second.find(key.second);
        if (ext_it != it->second.end()) {
            store_.remove(ext_it->second);
            it->second.erase(ext_it);
        }
        if (it->second.empty()) {
            trie_.erase(it);
        }
    }

    std::string prefix = join_components(lowered, 0, lowered.size()) + "/";
    auto sub = trie_.lower_bound(prefix);
    while (sub != trie_.end() && sub->first.compare(0, prefix.size(), prefix) == 0) {
        for (const auto& entry : sub->second) {
            store_.remove(entry.second);
        }
        sub = trie_.erase(sub);
    }
}

void PathCache::clear() {
    trie_.clear();
    store_.clear();
}


PathCacheFS::PathCacheFS(std::unique_ptr<FileSystem> fs): fs_(std::move(fs)) { }

std::string PathCacheFS::resolve(const std::string& path) {
    cache_.regen(*fs_, path);
    auto real = cache_.desensitize(path);
    if (!real) {
        throw FsError(ErrorKind::NotExist, path);
    }
    return *real;
}

std::string PathCacheFS::resolve_for_create(const std::string& path) {
    cache_.regen(*fs_, path);
    return cache_.resolve_for_create(path);
}

std::optional<std::string> PathCacheFS::desensitize(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.regen(*fs_, path);
    return cache_.desensitize(path);
}

void PathCacheFS::rebuild() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
}

size_t PathCacheFS::cached_path_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

std::unique_ptr<File> PathCacheFS::open_file(const std::string& path, OpenFlags flags) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (has_flag(flags, OpenFlags::Create)) {
        std::string real = resolve_for_create(path);
        auto file = fs_->open_file(real, flags);
        cache_.regen_exact(*fs_, real);
        return file;
    }

    std::string real = resolve(path);
    lock.unlock();
    return fs_->open_file(real, flags);
}

Metadata PathCacheFS::metadata(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string real = resolve(path);
    lock.unlock();
    return fs_->metadata(real);
}

bool PathCacheFS::exists(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.regen(*fs_, path);
    auto real = cache_.desensitize(path);
    lock.unlock();

    if (!real) {
        return false;
    }
    return fs_->exists(*real);
}

void PathCacheFS::create_dir(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string real = resolve_for_create(path);
    fs_->create_dir(real);
    cache_.regen_exact(*fs_, real);
}

void PathCacheFS::remove_dir(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string real = resolve(path);
    fs_->remove_dir(real);
    cache_.purge(real);
}

void PathCacheFS::remove_file(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string real = resolve(path);
    fs_->remove_file(real);
    cache_.purge(real);
}

void PathCacheFS::rename(const std::string& from, const std::string& to) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string real_from = resolve(from);
    std::string real_to = resolve_for_create(to);

    fs_->rename(real_from, real_to);
    cache_.purge(real_from);
    cache_.purge(real_to);
    cache_.regen_exact(*fs_, real_to);
}

std::vector<DirEntry> PathCacheFS::read_dir(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string real = resolve(path);
    lock.unlock();
    return fs_->read_dir(real);
}

} // namespace rgss_vfs
