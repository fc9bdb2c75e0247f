#include <iostream>
#include <vector>
#include <filesystem>
#include <optional>
#include <cstring>

#include "fuse_ops.hpp"
#include "project_fs.hpp"

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [--rtp DIR]... [--archive FILE] <project_dir> <mount_point> [FUSE options]\n";
    std::cerr << "\n";
    std::cerr << "Mount a game project as one case-insensitive filesystem.\n";
    std::cerr << "\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  --rtp DIR                   Runtime package directory layered below the project (repeatable)\n";
    std::cerr << "  --archive FILE              Archive to layer last (default: the first .rgssad/.rgss2a/.rgss3a\n";
    std::cerr << "                              file in the project directory)\n";
    std::cerr << "  project_dir                 Project directory; all writes go here\n";
    std::cerr << "  mount_point                 Directory where filesystem will be mounted\n";
    std::cerr << "\n";
    std::cerr << "Common FUSE options:\n";
    std::cerr << "  -f                          Run in foreground\n";
    std::cerr << "  -d                          Enable debug output\n";
    std::cerr << "  -s                          Single-threaded mode\n";
    std::cerr << "  -o option[,option...]       Mount options\n";
    std::cerr << "\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << prog_name << " ~/Game /mnt/game -f\n";
    std::cerr << "  " << prog_name << " --rtp /opt/rtp/Standard ~/Game /mnt/game -o ro\n";
    std::cerr << "\n";
}

int main(int argc, char **argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::filesystem::path> rtp_dirs;
    std::optional<std::filesystem::path> archive;
    std::vector<std::string> positional;
    std::vector<char*> fuse_args;

    // Always include program name as first FUSE arg
    fuse_args.push_back(argv[0]);

    bool parsing_paths = true;
    for (int i = 1; i < argc; i++) {
        bool takes_value = std::strcmp(argv[i], "--rtp") == 0 || std::strcmp(argv[i], "--archive") == 0;
        if (parsing_paths && takes_value) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " needs a value\n";
                print_usage(argv[0]);
                return 1;
            }
            if (argv[i][2] == 'r') {
                rtp_dirs.push_back(argv[i + 1]);
            } else {
                archive = std::filesystem::path(argv[i + 1]);
            }
            i++;
        } else if (argv[i][0] == '-') {
            // This is a FUSE option
            fuse_args.push_back(argv[i]);
            parsing_paths = false;
        } else if (parsing_paths) {
            positional.push_back(argv[i]);
        } else if (std::strcmp(fuse_args.back(), "-o") == 0) {
            fuse_args.push_back(argv[i]);
        } else {
            std::cerr << "Error: Unexpected argument '" << argv[i] << "' after FUSE options\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Error: Need a project directory and a mount point\n";
        print_usage(argv[0]);
        return 1;
    }

    const std::string& project_dir = positional[0];
    const std::string& mount_point = positional[1];

    // Validate that mount point exists and is a directory
    if (!std::filesystem::exists(mount_point)) {
        std::cerr << "Error: Mount point '" << mount_point << "' does not exist\n";
        return 1;
    }

    if (!std::filesystem::is_directory(mount_point)) {
        std::cerr << "Error: Mount point '" << mount_point << "' is not a directory\n";
        return 1;
    }

    if (archive && !std::filesystem::is_regular_file(*archive)) {
        std::cerr << "Error: '" << archive->string() << "' is not a regular file\n";
        return 1;
    }

    std::cerr << "Opening project: " << project_dir << "\n";
    try {
        rgss_vfs::Project project = rgss_vfs::open_project(project_dir, rtp_dirs, archive);
        if (project.archive) {
            std::cerr << "  Archive: " << project.archive->string() << "\n";
        }
        rgss_vfs::MountState::get_instance().set_filesystem(std::move(project.fs));
    } catch (const std::exception& e) {
        std::cerr << "Error opening project: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Mounting filesystem at " << mount_point << "\n";

    // Add mount point to FUSE args
    fuse_args.push_back(const_cast<char*>(mount_point.c_str()));

    fuse_args.push_back(const_cast<char*>("-o"));
    fuse_args.push_back(const_cast<char*>("default_permissions"));

    std::cerr << "\nStarting FUSE with arguments: ";
    for (const auto& arg : fuse_args) {
        std::cerr << arg << " ";
    }
    std::cerr << "\n" << std::endl;

    // Start FUSE
    int fuse_argc = fuse_args.size();
    struct fuse_operations* ops = rgss_vfs::get_vfs_operations();

    int ret = fuse_main(fuse_argc, fuse_args.data(), ops, nullptr);

    return ret;
}
