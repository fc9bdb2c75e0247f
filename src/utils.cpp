#include <cassert>
#include <list>
#include <string>
#include <tuple>

#include "utils.hpp"

namespace rgss_vfs {

PathSplit::PathSplit(const char* pathptr, const size_t pathlen) {
    size_t i = 0;
    size_t seg_start = 0;
    size_t seg_end = 0;

    bool seg_found = false;
    bool last_was_dots = false;

    is_dir_ = false;
    if (pathlen > 0) {
        assert(pathptr != nullptr);
    }
    if (pathlen > 0)
        is_dir_ = pathptr[pathlen-1] == '/';

    while (i <= pathlen) {
        seg_found = false;
        if (i == pathlen || pathptr[i] == '/') {
            seg_end = i;
            seg_found = true;
        }

        if (seg_found) {
            last_was_dots = false;
            size_t seg_len = seg_end - seg_start;
            if (seg_len) {
                if (seg_len == 1 && pathptr[seg_start] == '.') {
                    last_was_dots = true;
                } else if (seg_len == 2 && pathptr[seg_start] == '.' && pathptr[seg_start + 1] == '.') {
                    if (!segments_.empty()) {
                        segments_.pop_back();
                    }
                    last_was_dots = true;
                } else {
                    segments_.push_back(std::make_tuple(seg_start, seg_end));
                }
            }
            seg_start = i + 1;
        }
        i++;
    }

    is_dir_ |= last_was_dots;
}

PathSplit::PathSplit(const std::string& path): PathSplit::PathSplit(path.c_str(), path.length()) { }


std::vector<std::string> split_components(const std::string& path) {
    std::string slashed = path;
    for (auto& c : slashed) {
        if (c == '\\') {
            c = '/';
        }
    }

    PathSplit split(slashed);
    std::vector<std::string> components;
    components.reserve(split.segments().size());
    for (const auto& seg : split.segments()) {
        size_t start = std::get<0>(seg);
        size_t finish = std::get<1>(seg);
        components.emplace_back(slashed, start, finish - start);
    }
    return components;
}

std::string join_components(const std::vector<std::string>& components, size_t begin, size_t end) {
    std::string joined;
    for (size_t i = begin; i < end && i < components.size(); i++) {
        if (!joined.empty()) {
            joined.push_back('/');
        }
        joined += components[i];
    }
    return joined;
}

std::string normalize_path(const std::string& path) {
    auto components = split_components(path);
    return join_components(components, 0, components.size());
}

std::string join_path(const std::string& base, const std::string& name) {
    if (base.empty()) {
        return name;
    }
    if (name.empty()) {
        return base;
    }
    return base + "/" + name;
}

std::string parent_path(const std::string& path) {
    auto components = split_components(path);
    if (components.empty()) {
        return "";
    }
    return join_components(components, 0, components.size() - 1);
}

std::string file_name(const std::string& path) {
    auto components = split_components(path);
    if (components.empty()) {
        return "";
    }
    return components.back();
}

std::string to_lowercase(const std::string& str) {
    std::string lower = str;
    for (auto& c : lower) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return lower;
}

std::pair<std::string, std::string> split_extension(const std::string& name) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {name, ""};
    }
    return {name.substr(0, dot), name.substr(dot + 1)};
}

bool is_valid_utf8(const std::string& str) {
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t extra;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= str.size()) {
            return false;
        }
        for (size_t j = 1; j <= extra; j++) {
            if ((static_cast<unsigned char>(str[i + j]) & 0xC0) != 0x80) {
                return false;
            }
        }

        // Overlong forms, UTF-16 surrogates and code points past U+10FFFF
        if (extra >= 2) {
            unsigned char next = static_cast<unsigned char>(str[i + 1]);
            if ((c == 0xE0 && next < 0xA0) || (c == 0xED && next > 0x9F) ||
                (c == 0xF0 && next < 0x90) || (c == 0xF4 && next > 0x8F)) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

} // namespace rgss_vfs
