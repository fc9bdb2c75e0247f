#ifndef _UTILS_HPP
#define _UTILS_HPP

#include <list>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace rgss_vfs {


template<typename T>
class Singleton {
public:
    static T& get_instance() {
        static T instance;
        return instance;
    }

    Singleton(const Singleton&) = delete;
    Singleton& operator=(const Singleton&) = delete;
    Singleton(Singleton&&) = delete;
    Singleton& operator=(Singleton&&) = delete;

protected:
    Singleton() = default;
    virtual ~Singleton() = default;
};


// Splits a '/'-separated path into [start, end) segments, dropping empty and
// "." segments and folding ".." into its parent.
class PathSplit {
public:
    PathSplit(const std::string& path);
    PathSplit(const char* pathptr, const size_t pathlen);

    inline const std::list<std::tuple<size_t, size_t>>& segments() const {
        return segments_;
    }

    inline bool is_dir() const {
        return is_dir_;
    }

protected:
    std::list< std::tuple < size_t, size_t > > segments_;
    bool is_dir_;
};

// Path components of `path`. Backslashes are treated as separators.
std::vector<std::string> split_components(const std::string& path);

std::string join_components(const std::vector<std::string>& components, size_t begin, size_t end);

// Canonical form used by every backend: components joined by '/', no leading
// or trailing slash. The root is the empty string.
std::string normalize_path(const std::string& path);

std::string join_path(const std::string& base, const std::string& name);
std::string parent_path(const std::string& path);
std::string file_name(const std::string& path);

// ASCII case folding; bytes outside the ASCII range are left untouched.
std::string to_lowercase(const std::string& str);

// Splits a single path component into (stem, extension) without the dot.
// Names with no dot or a leading dot only have no extension.
std::pair<std::string, std::string> split_extension(const std::string& name);

bool is_valid_utf8(const std::string& str);

}

#endif
