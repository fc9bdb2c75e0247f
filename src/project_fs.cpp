#include <algorithm>
#include <iostream>

#include "project_fs.hpp"
#include "archive_fs.hpp"
#include "error.hpp"
#include "host_fs.hpp"
#include "overlay_fs.hpp"
#include "utils.hpp"

namespace rgss_vfs {

std::optional<std::filesystem::path> find_archive(const std::filesystem::path& project_dir) {
    HostFS host(project_dir);
    std::vector<std::string> names;

    for (const auto& entry : host.read_dir("")) {
        if (!entry.metadata.is_file) {
            continue;
        }
        std::string name = entry.file_name();
        std::string extension = to_lowercase(split_extension(name).second);
        if (extension == "rgssad" || extension == "rgss2a" || extension == "rgss3a") {
            names.push_back(name);
        }
    }

    if (names.empty()) {
        return std::nullopt;
    }
    std::sort(names.begin(), names.end());
    return project_dir / names.front();
}

Project open_project(const std::filesystem::path& project_dir,
                     const std::vector<std::filesystem::path>& rtp_dirs,
                     const std::optional<std::filesystem::path>& archive) {
    std::error_code ec;
    if (!std::filesystem::is_directory(project_dir, ec)) {
        throw FsError(ErrorKind::NotExist, "Project directory " + project_dir.string());
    }

    Project project;
    project.archive = archive ? archive : find_archive(project_dir);

    auto overlay = std::make_unique<OverlayFS>();
    overlay->push_layer(std::make_unique<HostFS>(project_dir));

    for (const auto& rtp : rtp_dirs) {
        if (!std::filesystem::is_directory(rtp, ec)) {
            std::cerr << "Warning: runtime package directory " << rtp << " not found, skipping" << std::endl;
            project.missing_rtps.push_back(rtp);
            continue;
        }
        overlay->push_layer(std::make_unique<HostFS>(rtp));
    }

    if (project.archive) {
        const auto& path = *project.archive;
        auto archive_fs = with_context("While opening archive " + path.string(), [&]() {
            return std::make_unique<ArchiveFS>(HostFile::open(path, OpenFlags::Read));
        });
        overlay->push_layer(std::move(archive_fs));
    }

    std::cerr << "Project " << project_dir << ": " << overlay->layer_count() << " layers" << std::endl;
    project.fs = std::make_unique<PathCacheFS>(std::move(overlay));
    return project;
}

}
