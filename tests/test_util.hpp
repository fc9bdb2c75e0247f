#ifndef _TEST_UTIL_HPP
#define _TEST_UTIL_HPP

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

// Scratch directory removed with everything in it when the test ends.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "rgss_vfs_test.XXXXXX").string();
        char* dir = mkdtemp(tmpl.data());
        assert(dir != nullptr);
        path_ = dir;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    inline const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_host_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    assert(out.good());
}

inline std::string read_host_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

#endif
