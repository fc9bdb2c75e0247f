#include "filesystem.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace rgss_vfs {

std::string DirEntry::file_name() const {
    return rgss_vfs::file_name(path);
}

void File::read_exact(char* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        size_t n = read(buf + done, len - done);
        if (n == 0) {
            throw FsError(ErrorKind::IO, "Unexpected end of file (wanted " + std::to_string(len) +
                          " bytes, got " + std::to_string(done) + ")");
        }
        done += n;
    }
}

void File::write_all(const char* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        size_t n = write(buf + done, len - done);
        if (n == 0) {
            throw FsError(ErrorKind::IO, "Failed to write whole buffer");
        }
        done += n;
    }
}

uint64_t File::stream_position() {
    return seek(0, SeekFrom::Current);
}

std::vector<char> File::read_to_end() {
    std::vector<char> data;
    char chunk[65536];
    size_t n;
    while ((n = read(chunk, sizeof(chunk))) > 0) {
        data.insert(data.end(), chunk, chunk + n);
    }
    return data;
}

std::future<size_t> File::read_async(char* buf, size_t len) {
    return std::async(std::launch::async, [this, buf, len]() {
        return read(buf, len);
    });
}

std::unique_ptr<File> FileSystem::create_file(const std::string& path) {
    return open_file(path, OpenFlags::Create | OpenFlags::Write);
}

void FileSystem::remove(const std::string& path) {
    if (metadata(path).is_file) {
        remove_file(path);
    } else {
        remove_dir(path);
    }
}

std::vector<char> FileSystem::read(const std::string& path) {
    auto file = open_file(path, OpenFlags::Read);
    return file->read_to_end();
}

std::string FileSystem::read_to_string(const std::string& path) {
    auto data = read(path);
    std::string str(data.begin(), data.end());
    if (!is_valid_utf8(str)) {
        throw FsError(ErrorKind::IO, "File " + path + " is not valid UTF-8");
    }
    return str;
}

void FileSystem::write(const std::string& path, const char* data, size_t len) {
    auto file = open_file(path, OpenFlags::Write | OpenFlags::Truncate | OpenFlags::Create);
    file->write_all(data, len);
    file->flush();
}

void FileSystem::write(const std::string& path, const std::string& data) {
    write(path, data.data(), data.size());
}

} // namespace rgss_vfs
