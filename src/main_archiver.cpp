#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <chrono>
#include <getopt.h>

#include "archive_fs.hpp"
#include "archive_tools.hpp"
#include "host_fs.hpp"
#include "zip_bridge.hpp"

using namespace rgss_vfs;

enum class Mode {
    None,
    List,
    Extract,
    Create,
    ExportZip,
    ImportZip,
};

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " --list ARCHIVE\n";
    std::cerr << "       " << prog_name << " --extract DIR ARCHIVE\n";
    std::cerr << "       " << prog_name << " --create DIR --output ARCHIVE [--version N]\n";
    std::cerr << "       " << prog_name << " --export-zip FILE ARCHIVE\n";
    std::cerr << "       " << prog_name << " --import-zip FILE --output ARCHIVE [--version N]\n";
    std::cerr << "\n";
    std::cerr << "Inspect, unpack and build RGSSAD archives (.rgssad, .rgss2a, .rgss3a).\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list              List every file in ARCHIVE with its size\n";
    std::cerr << "  -x, --extract DIR       Extract ARCHIVE into DIR\n";
    std::cerr << "  -c, --create DIR        Build an archive from the files in DIR\n";
    std::cerr << "  -e, --export-zip FILE   Write the contents of ARCHIVE to a ZIP file\n";
    std::cerr << "  -i, --import-zip FILE   Build an archive from the files in a ZIP file\n";
    std::cerr << "  -o, --output ARCHIVE    Archive to write (with --create or --import-zip)\n";
    std::cerr << "  -v, --version N         Archive version to write: 1, 2 or 3 (default: 3)\n";
    std::cerr << "  -h, --help              Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << prog_name << " --create Game --output Game.rgss3a\n";
    std::cerr << "  " << prog_name << " --extract out Game.rgss2a\n";
    std::cerr << "\n";
}

template<typename T>
T wait_with_progress(std::future<T>& future, const std::atomic<size_t>& progress, size_t total, const char* what) {
    size_t last = static_cast<size_t>(-1);
    while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        size_t done = progress.load();
        if (done != last) {
            last = done;
            std::cout << what << ": " << done << "/" << total << "\r" << std::flush;
        }
    }
    std::cout << what << ": " << progress.load() << "/" << total << "\n";
    return future.get();
}

std::unique_ptr<ArchiveFS> open_archive(const std::string& path) {
    return std::make_unique<ArchiveFS>(HostFile::open(path, OpenFlags::Read));
}

int list_archive(const std::string& archive_path) {
    auto archive = open_archive(archive_path);
    auto sources = collect_sources(*archive);

    uint64_t total_size = 0;
    for (const auto& source : sources) {
        std::cout << source.size << "\t" << source.path << "\n";
        total_size += source.size;
    }
    std::cout << "\nVersion " << static_cast<int>(archive->version()) << " archive, "
              << archive->file_count() << " files, " << total_size << " bytes\n";
    return 0;
}

int extract_archive(const std::string& archive_path, const std::string& dest_dir) {
    auto archive = open_archive(archive_path);
    std::filesystem::create_directories(dest_dir);
    HostFS dest(dest_dir);

    std::cout << "Extracting " << archive_path << " to " << dest_dir << "\n";
    std::atomic<size_t> progress(0);
    auto future = extract_async(*archive, dest, &progress);
    wait_with_progress(future, progress, archive->file_count(), "Extracting");
    return 0;
}

// Builds into "<output>.tmp" and renames it over `output_path` only once complete.
int write_archive(const std::string& output_path, uint8_t version, std::vector<ArchiveSource> sources) {
    std::string tmp_path = output_path + ".tmp";
    size_t total = sources.size();

    std::cout << "Writing version " << static_cast<int>(version) << " archive: " << output_path << "\n";
    std::cout << "Files: " << total << "\n\n";

    std::atomic<size_t> progress(0);
    auto buffer = HostFile::open(tmp_path, OpenFlags::Read | OpenFlags::Write | OpenFlags::Create | OpenFlags::Truncate);
    auto future = ArchiveFS::create_async(std::move(buffer), version, std::move(sources), &progress);

    try {
        wait_with_progress(future, progress, total, "Writing archive");
    } catch (const std::exception&) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        throw;
    }

    std::filesystem::rename(tmp_path, output_path);
    std::cout << "Archive size: " << std::filesystem::file_size(output_path) << " bytes\n";
    return 0;
}

int create_archive(const std::string& source_dir, const std::string& output_path, uint8_t version) {
    if (!std::filesystem::is_directory(source_dir)) {
        std::cerr << "Error: '" << source_dir << "' is not a directory\n";
        return 1;
    }
    HostFS source(source_dir);
    return write_archive(output_path, version, collect_sources(source));
}

int export_archive(const std::string& archive_path, const std::string& zip_path) {
    auto archive = open_archive(archive_path);

    std::cout << "Exporting " << archive_path << " to " << zip_path << "\n";
    std::atomic<size_t> progress(0);
    size_t written = export_zip(*archive, zip_path, &progress);
    std::cout << "Files written: " << written << "\n";
    return 0;
}

int import_archive(const std::string& zip_path, const std::string& output_path, uint8_t version) {
    ZipReader reader(zip_path);
    return write_archive(output_path, version, reader.sources());
}

int main(int argc, char** argv) {
    Mode mode = Mode::None;
    std::string mode_arg;
    std::string output_path;
    int version = 3;

    // Parse command-line arguments
    struct option long_options[] = {
        {"list", no_argument, 0, 'l'},
        {"extract", required_argument, 0, 'x'},
        {"create", required_argument, 0, 'c'},
        {"export-zip", required_argument, 0, 'e'},
        {"import-zip", required_argument, 0, 'i'},
        {"output", required_argument, 0, 'o'},
        {"version", required_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "lx:c:e:i:o:v:h", long_options, &option_index)) != -1) {
        Mode selected = Mode::None;
        switch (opt) {
            case 'l':
                selected = Mode::List;
                break;
            case 'x':
                selected = Mode::Extract;
                break;
            case 'c':
                selected = Mode::Create;
                break;
            case 'e':
                selected = Mode::ExportZip;
                break;
            case 'i':
                selected = Mode::ImportZip;
                break;
            case 'o':
                output_path = optarg;
                break;
            case 'v':
                try {
                    version = std::stoi(optarg);
                } catch (const std::exception&) {
                    version = 0;
                }
                if (version < 1 || version > 3) {
                    std::cerr << "Error: version must be 1, 2 or 3\n";
                    return 1;
                }
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }

        if (selected != Mode::None) {
            if (mode != Mode::None) {
                std::cerr << "Error: only one of --list, --extract, --create, --export-zip, --import-zip may be given\n";
                return 1;
            }
            mode = selected;
            if (selected != Mode::List) {
                mode_arg = optarg;
            }
        }
    }

    bool takes_archive = mode == Mode::List || mode == Mode::Extract || mode == Mode::ExportZip;
    bool writes_archive = mode == Mode::Create || mode == Mode::ImportZip;

    if (mode == Mode::None) {
        std::cerr << "Error: No operation given\n";
        print_usage(argv[0]);
        return 1;
    }
    if (takes_archive && optind + 1 != argc) {
        std::cerr << "Error: Missing input archive path\n";
        print_usage(argv[0]);
        return 1;
    }
    if (writes_archive && (output_path.empty() || optind != argc)) {
        std::cerr << "Error: --output is required and no positional arguments are accepted\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        switch (mode) {
            case Mode::List:
                return list_archive(argv[optind]);
            case Mode::Extract:
                return extract_archive(argv[optind], mode_arg);
            case Mode::Create:
                return create_archive(mode_arg, output_path, static_cast<uint8_t>(version));
            case Mode::ExportZip:
                return export_archive(argv[optind], mode_arg);
            case Mode::ImportZip:
                return import_archive(mode_arg, output_path, static_cast<uint8_t>(version));
            case Mode::None:
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 1;
}
