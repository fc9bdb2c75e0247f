#ifndef _PROJECT_FS_HPP
#define _PROJECT_FS_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "path_cache_fs.hpp"

namespace rgss_vfs {

struct Project {
    // Project directory, then every runtime package found, then the archive,
    // all behind one case-insensitive cache.
    std::unique_ptr<PathCacheFS> fs;
    std::optional<std::filesystem::path> archive;
    std::vector<std::filesystem::path> missing_rtps;
};

// First file directly inside `project_dir` with an rgssad, rgss2a or rgss3a
// extension (any case), in name order.
std::optional<std::filesystem::path> find_archive(const std::filesystem::path& project_dir);

// Assembles the layered namespace of a project. Runtime package directories
// that do not exist are skipped and reported in `missing_rtps`. If `archive`
// is given it is used instead of searching the project directory.
Project open_project(const std::filesystem::path& project_dir,
                     const std::vector<std::filesystem::path>& rtp_dirs,
                     const std::optional<std::filesystem::path>& archive = std::nullopt);

}

#endif
