#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <iostream>
#include <random>

#include "archive_fs.hpp"
#include "error.hpp"
#include "host_fs.hpp"
#include "utils.hpp"

namespace rgss_vfs {

namespace {

// Buffered forward reader over an archive stream that tracks its own offset.
class StreamReader {
public:
    StreamReader(File& file, uint64_t position): file_(file) {
        seek(position);
    }

    // Returns false if the stream ends before `len` bytes were read.
    bool read(char* buf, size_t len) {
        size_t done = 0;
        while (done < len) {
            if (buf_pos_ == buf_len_) {
                buf_pos_ = 0;
                buf_len_ = file_.read(buf_, sizeof(buf_));
                if (buf_len_ == 0) {
                    return false;
                }
            }
            size_t n = std::min(len - done, buf_len_ - buf_pos_);
            std::memcpy(buf + done, buf_ + buf_pos_, n);
            done += n;
            buf_pos_ += n;
            position_ += n;
        }
        return true;
    }

    bool read_u32(uint32_t& value) {
        unsigned char bytes[4];
        if (!read(reinterpret_cast<char*>(bytes), 4)) {
            return false;
        }
        value = static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8) |
                (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
        return true;
    }

    void seek(uint64_t position) {
        file_.seek(static_cast<int64_t>(position), SeekFrom::Start);
        position_ = position;
        buf_pos_ = 0;
        buf_len_ = 0;
    }

    inline uint64_t position() const { return position_; }

private:
    File& file_;
    char buf_[65536];
    size_t buf_pos_ = 0;
    size_t buf_len_ = 0;
    uint64_t position_ = 0;
};

void put_u32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
}

// Streams exactly `size` bytes from `input` to `output` through the body keystream.
void copy_xor(File& input, File& output, uint32_t size, uint32_t start_magic) {
    KeyStream keystream(start_magic);
    std::vector<char> chunk(std::min<size_t>(size, 65536));
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        size_t n = input.read(chunk.data(), want);
        if (n == 0) {
            throw FsError(ErrorKind::IO, "Source ended after " + std::to_string(size - remaining) +
                          " of " + std::to_string(size) + " bytes");
        }
        keystream.apply(chunk.data(), n);
        output.write_all(chunk.data(), n);
        remaining -= n;
    }
}

std::unique_ptr<File> open_source(const ArchiveSource& source) {
    if (!source.open) {
        throw FsError(ErrorKind::IO, "No byte source for " + source.path);
    }
    auto input = source.open();
    if (!input) {
        throw FsError(ErrorKind::IO, "No byte source for " + source.path);
    }
    return input;
}

std::string describe(size_t i, const std::string& path, uint64_t size) {
    return "file #" + std::to_string(i) + " (path = \"" + path + "\", file length = " + std::to_string(size) + ")";
}

void write_v1(File& output, const std::vector<ArchiveSource>& files, ArchiveIndex& index,
              std::atomic<size_t>* progress) {
    uint32_t magic = kArchiveMagic;
    uint64_t header_offset = 8;

    for (size_t i = 0; i < files.size(); i++) {
        const auto& source = files[i];
        std::string path = normalize_path(source.path);
        std::string where = describe(i, path, source.size);

        std::string record;
        record.reserve(path.size() + 8);
        put_u32(record, static_cast<uint32_t>(path.size()) ^ advance_magic(magic));
        for (char b : path) {
            if (b == '/') {
                b = '\\';
            }
            record.push_back(static_cast<char>(b ^ static_cast<char>(advance_magic(magic) & 0xFF)));
        }
        put_u32(record, source.size ^ advance_magic(magic));

        with_context("While writing the header of " + where, [&]() {
            output.write_all(record.data(), record.size());
        });
        auto input = with_context("While opening " + where, [&]() { return open_source(source); });
        with_context("While writing the contents of " + where, [&]() {
            copy_xor(*input, output, source.size, magic);
        });

        index.create_file(path, ArchiveEntry{source.size, header_offset, header_offset + record.size(), magic});
        header_offset += record.size() + source.size;
        if (progress) {
            progress->fetch_add(1);
        }
    }
}

uint32_t write_v3(File& output, const std::vector<ArchiveSource>& files, ArchiveIndex& index,
                  std::atomic<size_t>* progress) {
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<uint32_t> dist;

    uint32_t base_magic = dist(rng);
    std::string seed;
    put_u32(seed, (base_magic - 3u) * 954437177u);
    with_context("While writing the archive base magic value", [&]() {
        output.write_all(seed.data(), seed.size());
    });

    auto scratch = with_context("While creating a temporary file", []() { return HostFile::temporary(); });

    std::vector<std::pair<std::string, ArchiveEntry>> entries;
    entries.reserve(files.size());
    uint64_t header_offset = 12;
    uint64_t body_offset = 0;

    for (size_t i = 0; i < files.size(); i++) {
        const auto& source = files[i];
        std::string path = normalize_path(source.path);
        std::string where = describe(i, path, source.size);
        uint32_t entry_magic = dist(rng);

        // The body offset is written as a placeholder and patched below.
        std::string record;
        record.reserve(path.size() + 16);
        put_u32(record, 0);
        put_u32(record, source.size ^ base_magic);
        put_u32(record, entry_magic ^ base_magic);
        put_u32(record, static_cast<uint32_t>(path.size()) ^ base_magic);
        for (size_t j = 0; j < path.size(); j++) {
            char b = path[j] == '/' ? '\\' : path[j];
            record.push_back(static_cast<char>(b ^ static_cast<char>((base_magic >> (8 * (j % 4))) & 0xFF)));
        }

        with_context("While writing the header of " + where, [&]() {
            output.write_all(record.data(), record.size());
        });
        auto input = with_context("While opening " + where, [&]() { return open_source(source); });
        with_context("While writing the contents of " + where + " to a temporary file", [&]() {
            copy_xor(*input, *scratch, source.size, entry_magic);
        });

        entries.emplace_back(path, ArchiveEntry{source.size, header_offset, body_offset, entry_magic});
        header_offset += path.size() + 16;
        body_offset += source.size;
        if (progress) {
            progress->fetch_add(1);
        }
    }

    std::string terminator;
    put_u32(terminator, base_magic);
    with_context("While writing the header terminator to the archive", [&]() {
        output.write_all(terminator.data(), terminator.size());
    });

    with_context("While copying a temporary file containing the archive body into the archive", [&]() {
        scratch->seek(0, SeekFrom::Start);
        char chunk[65536];
        size_t n;
        while ((n = scratch->read(chunk, sizeof(chunk))) > 0) {
            output.write_all(chunk, n);
        }
    });

    uint64_t header_size = header_offset + 4;
    for (size_t i = 0; i < entries.size(); i++) {
        auto& path = entries[i].first;
        auto& entry = entries[i].second;
        entry.body_offset += header_size;
        if (entry.body_offset > UINT32_MAX) {
            throw FsError(ErrorKind::NotSupported, "Offset of " + describe(i, path, entry.size) +
                          " does not fit in a version 3 archive");
        }
        std::string offset;
        put_u32(offset, static_cast<uint32_t>(entry.body_offset) ^ base_magic);
        with_context("While writing the file offset of " + describe(i, path, entry.size), [&]() {
            output.seek(static_cast<int64_t>(entry.header_offset), SeekFrom::Start);
            output.write_all(offset.data(), offset.size());
        });
        index.create_file(path, entry);
    }

    return base_magic;
}

} // namespace

uint32_t advance_magic(uint32_t& magic) {
    uint32_t old = magic;
    magic = magic * 7u + 3u;
    return old;
}

uint32_t regress_magic(uint32_t& magic) {
    uint32_t old = magic;
    magic = (magic - 3u) * 3067833783u;
    return old;
}


KeyStream::KeyStream(uint32_t start_magic): magic_(start_magic), position_(0) { }

void KeyStream::apply(char* data, size_t len) {
    for (size_t i = 0; i < len; i++) {
        unsigned shift = 8 * static_cast<unsigned>(position_ % 4);
        data[i] = static_cast<char>(data[i] ^ static_cast<char>((magic_ >> shift) & 0xFF));
        position_++;
        if (position_ % 4 == 0) {
            advance_magic(magic_);
        }
    }
}

void KeyStream::skip(uint64_t count) {
    uint64_t target = position_ + count;
    uint64_t steps = target / 4 - position_ / 4;

    // magic -> a * magic + b, raised to the power `steps` by squaring.
    uint32_t a = 1, b = 0;
    uint32_t step_a = 7, step_b = 3;
    while (steps > 0) {
        if (steps & 1) {
            b = step_a * b + step_b;
            a = step_a * a;
        }
        step_b = step_a * step_b + step_b;
        step_a = step_a * step_a;
        steps >>= 1;
    }
    magic_ = a * magic_ + b;
    position_ = target;
}


const ArchiveDirectory* ArchiveDirectory::find_dir(const std::string& name) const {
    auto it = dirs_.find(name);
    if (it != dirs_.end()) {
        return it->second.get();
    }
    return nullptr;
}

const ArchiveEntry* ArchiveDirectory::find_file(const std::string& name) const {
    auto it = files_.find(name);
    if (it != files_.end()) {
        return &it->second;
    }
    return nullptr;
}


bool ArchiveIndex::create_file(const std::string& path, const ArchiveEntry& entry) {
    PathSplit path_split(path);
    if (path_split.is_dir() || path_split.segments().empty()) {
        return false;
    }

    ArchiveDirectory* current_dir = &root_;
    const auto& segments = path_split.segments();
    auto last = std::prev(segments.end());

    // All segments except the last are directories
    for (auto it = segments.begin(); it != last; ++it) {
        std::string dir_name(path, std::get<0>(*it), std::get<1>(*it) - std::get<0>(*it));
        auto dir_it = current_dir->dirs_.find(dir_name);
        if (dir_it == current_dir->dirs_.end()) {
            dir_it = current_dir->dirs_.emplace(dir_name, std::make_unique<ArchiveDirectory>()).first;
        }
        current_dir = dir_it->second.get();
    }

    std::string name(path, std::get<0>(*last), std::get<1>(*last) - std::get<0>(*last));
    if (current_dir->dirs_.count(name) != 0) {
        return false;
    }
    if (!current_dir->files_.emplace(name, entry).second) {
        return false;
    }
    file_count_++;
    return true;
}

const ArchiveDirectory* ArchiveIndex::lookup_dir(const std::string& path) const {
    PathSplit path_split(path);
    const ArchiveDirectory* current_dir = &root_;

    for (const auto& seg : path_split.segments()) {
        std::string name(path, std::get<0>(seg), std::get<1>(seg) - std::get<0>(seg));
        current_dir = current_dir->find_dir(name);
        if (!current_dir) {
            return nullptr;
        }
    }

    return current_dir;
}

const ArchiveEntry* ArchiveIndex::lookup_file(const std::string& path) const {
    PathSplit path_split(path);
    if (path_split.is_dir() || path_split.segments().empty()) {
        return nullptr;
    }

    const auto& segments = path_split.segments();
    auto last = std::prev(segments.end());

    // Navigate to parent directory
    const ArchiveDirectory* current_dir = &root_;
    for (auto it = segments.begin(); it != last; ++it) {
        std::string name(path, std::get<0>(*it), std::get<1>(*it) - std::get<0>(*it));
        current_dir = current_dir->find_dir(name);
        if (!current_dir) {
            return nullptr;
        }
    }

    std::string file_name(path, std::get<0>(*last), std::get<1>(*last) - std::get<0>(*last));
    return current_dir->find_file(file_name);
}


ArchiveFile::ArchiveFile(std::shared_ptr<ArchiveStream> stream, const ArchiveEntry& entry, bool readable, bool writable)
    : stream_(std::move(stream)), entry_(entry), readable_(readable), writable_(writable), position_(0),
      keystream_(entry.start_magic) { }

KeyStream& ArchiveFile::keystream_at(uint64_t position) {
    if (position < keystream_.position()) {
        keystream_ = KeyStream(entry_.start_magic);
    }
    keystream_.skip(position - keystream_.position());
    return keystream_;
}

size_t ArchiveFile::read(char* buf, size_t len) {
    if (!readable_) {
        throw FsError(ErrorKind::IO, "File was not opened for reading");
    }
    if (position_ >= entry_.size || len == 0) {
        return 0;
    }

    size_t n = static_cast<size_t>(std::min<uint64_t>(len, entry_.size - position_));
    {
        std::lock_guard<std::mutex> lock(stream_->mutex);
        stream_->file->seek(static_cast<int64_t>(entry_.body_offset + position_), SeekFrom::Start);
        stream_->file->read_exact(buf, n);
    }
    keystream_at(position_).apply(buf, n);
    position_ += n;
    return n;
}

size_t ArchiveFile::write(const char* buf, size_t len) {
    if (!writable_) {
        throw FsError(ErrorKind::IO, "File was not opened for writing");
    }
    if (len == 0) {
        return 0;
    }
    if (position_ + len > entry_.size) {
        throw FsError(ErrorKind::NotSupported,
                      "Cannot grow a file inside an archive (rebuild the archive to change file sizes)");
    }

    std::vector<char> encoded(buf, buf + len);
    keystream_at(position_).apply(encoded.data(), len);
    {
        std::lock_guard<std::mutex> lock(stream_->mutex);
        stream_->file->seek(static_cast<int64_t>(entry_.body_offset + position_), SeekFrom::Start);
        stream_->file->write_all(encoded.data(), len);
    }
    position_ += len;
    return len;
}

uint64_t ArchiveFile::seek(int64_t offset, SeekFrom whence) {
    int64_t base = 0;
    if (whence == SeekFrom::Current) {
        base = static_cast<int64_t>(position_);
    } else if (whence == SeekFrom::End) {
        base = static_cast<int64_t>(entry_.size);
    }
    if (base + offset < 0) {
        throw io_error("Invalid seek", EINVAL);
    }
    position_ = static_cast<uint64_t>(base + offset);
    return position_;
}

void ArchiveFile::flush() {
    if (!writable_) {
        return;
    }
    std::lock_guard<std::mutex> lock(stream_->mutex);
    stream_->file->flush();
}

Metadata ArchiveFile::metadata() const {
    return Metadata{true, entry_.size};
}

void ArchiveFile::set_len(uint64_t new_size) {
    if (new_size != entry_.size) {
        throw FsError(ErrorKind::NotSupported,
                      "Cannot resize a file inside an archive (rebuild the archive to change file sizes)");
    }
}


ArchiveFS::ArchiveFS(std::unique_ptr<File> stream)
    : stream_(std::make_shared<ArchiveStream>()), version_(0), base_magic_(kArchiveMagic) {
    stream_->file = std::move(stream);
    std::lock_guard<std::mutex> lock(stream_->mutex);
    File& file = *stream_->file;

    uint64_t stream_len = with_context("While detecting archive version", [&]() {
        return file.seek(0, SeekFrom::End);
    });

    StreamReader reader(file, 0);
    char header[8];
    bool has_header = with_context("While reading the archive signature", [&]() {
        return reader.read(header, sizeof(header));
    });
    if (!has_header || std::memcmp(header, kArchiveSignature, sizeof(kArchiveSignature)) != 0) {
        throw FsError(ErrorKind::InvalidHeader, "Missing archive signature");
    }
    version_ = static_cast<uint8_t>(header[7]);

    switch (version_) {
        case 1:
        case 2:
            index_v1(stream_len);
            break;
        case 3:
            index_v3(stream_len);
            break;
        default:
            throw FsError(ErrorKind::InvalidArchiveVersion, "Version " + std::to_string(version_));
    }

    std::cerr << "    Archive version " << static_cast<int>(version_)
              << ", files indexed: " << index_.file_count() << std::endl;
}

ArchiveFS::ArchiveFS(std::shared_ptr<ArchiveStream> stream, ArchiveIndex index, uint8_t version, uint32_t base_magic)
    : stream_(std::move(stream)), index_(std::move(index)), version_(version), base_magic_(base_magic) { }

void ArchiveFS::index_v1(uint64_t stream_len) {
    const std::string c = "While performing initial parsing of the header of a version " +
                          std::to_string(version_) + " archive";
    auto fail = [&](const std::string& message) {
        return FsError(ErrorKind::InvalidHeader, message).with_context(c);
    };

    StreamReader reader(*stream_->file, 8);
    uint32_t magic = kArchiveMagic;
    size_t skipped = 0;

    for (size_t i = 0;; i++) {
        uint64_t header_offset = reader.position();
        std::string where = "file #" + std::to_string(i) + " at offset " + std::to_string(header_offset);
        auto read = [&](char* buf, size_t len) {
            return with_context("While reading " + where, [&]() { return reader.read(buf, len); });
        };
        auto read_u32 = [&](uint32_t& value) {
            return with_context("While reading " + where, [&]() { return reader.read_u32(value); });
        };

        uint32_t path_len;
        if (!read_u32(path_len)) {
            break;
        }
        path_len ^= advance_magic(magic);
        if (path_len > stream_len - reader.position()) {
            throw fail("Path length " + std::to_string(path_len) + " of " + where + " runs past the end of the archive");
        }

        std::string path(path_len, '\0');
        if (!read(path.data(), path_len)) {
            throw fail("While reading the path (path length = " + std::to_string(path_len) + ") of " + where);
        }
        for (auto& byte : path) {
            char ch = static_cast<char>(byte ^ static_cast<char>(advance_magic(magic) & 0xFF));
            byte = ch == '\\' ? '/' : ch;
        }
        if (!is_valid_utf8(path)) {
            throw fail("Path of " + where + " is not valid UTF-8");
        }

        uint32_t size;
        if (!read_u32(size)) {
            throw fail("While reading the file length (path = \"" + path + "\") of " + where);
        }
        size ^= advance_magic(magic);

        ArchiveEntry entry{size, header_offset, reader.position(), magic};
        if (entry.body_offset + entry.size > stream_len) {
            throw fail("Body of " + where + " (path = \"" + path + "\", file length = " + std::to_string(size) +
                       ") runs past the end of the archive");
        }
        if (!index_.create_file(normalize_path(path), entry)) {
            skipped++;
        }

        with_context("While seeking to the end of " + where, [&]() {
            reader.seek(entry.body_offset + entry.size);
        });
    }

    if (skipped > 0) {
        std::cerr << "Warning: " << skipped << " duplicate or unnamed archive entries skipped" << std::endl;
    }
}

void ArchiveFS::index_v3(uint64_t stream_len) {
    const std::string c = "While performing initial parsing of the header of a version 3 archive";
    auto fail = [&](const std::string& message) {
        return FsError(ErrorKind::InvalidHeader, message).with_context(c);
    };

    StreamReader reader(*stream_->file, 8);
    uint32_t seed;
    bool has_seed = with_context("While reading the base magic value of the archive", [&]() {
        return reader.read_u32(seed);
    });
    if (!has_seed) {
        throw fail("While reading the base magic value of the archive");
    }
    base_magic_ = seed * 9u + 3u;
    size_t skipped = 0;

    for (size_t i = 0;; i++) {
        uint64_t header_offset = reader.position();
        std::string where = "file #" + std::to_string(i) + " at offset " + std::to_string(header_offset);
        auto read = [&](char* buf, size_t len) {
            return with_context("While reading " + where, [&]() { return reader.read(buf, len); });
        };
        auto read_u32 = [&](uint32_t& value) {
            return with_context("While reading " + where, [&]() { return reader.read_u32(value); });
        };

        uint32_t body_offset;
        if (!read_u32(body_offset)) {
            break;
        }
        body_offset ^= base_magic_;
        if (body_offset == 0) {
            break;
        }

        uint32_t size, magic, path_len;
        if (!read_u32(size)) {
            throw fail("While reading the file length (file offset = " + std::to_string(body_offset) + ") of " + where);
        }
        if (!read_u32(magic)) {
            throw fail("While reading the magic value (file offset = " + std::to_string(body_offset) + ") of " + where);
        }
        if (!read_u32(path_len)) {
            throw fail("While reading the path length (file offset = " + std::to_string(body_offset) + ") of " + where);
        }
        size ^= base_magic_;
        magic ^= base_magic_;
        path_len ^= base_magic_;

        if (path_len > stream_len - reader.position()) {
            throw fail("Path length " + std::to_string(path_len) + " of " + where + " runs past the end of the archive");
        }
        std::string path(path_len, '\0');
        if (!read(path.data(), path_len)) {
            throw fail("While reading the path (path length = " + std::to_string(path_len) + ") of " + where);
        }
        for (size_t j = 0; j < path.size(); j++) {
            char ch = static_cast<char>(path[j] ^ static_cast<char>((base_magic_ >> (8 * (j % 4))) & 0xFF));
            path[j] = ch == '\\' ? '/' : ch;
        }
        if (!is_valid_utf8(path)) {
            throw fail("Path of " + where + " is not valid UTF-8");
        }

        ArchiveEntry entry{size, header_offset, body_offset, magic};
        if (entry.body_offset + entry.size > stream_len) {
            throw fail("Body of " + where + " (path = \"" + path + "\", file length = " + std::to_string(size) +
                       ") runs past the end of the archive");
        }
        if (!index_.create_file(normalize_path(path), entry)) {
            skipped++;
        }
    }

    if (skipped > 0) {
        std::cerr << "Warning: " << skipped << " duplicate or unnamed archive entries skipped" << std::endl;
    }
}

std::unique_ptr<ArchiveFS> ArchiveFS::from_buffer_and_files(std::unique_ptr<File> buffer,
                                                            uint8_t version,
                                                            const std::vector<ArchiveSource>& files,
                                                            std::atomic<size_t>* progress) {
    const std::string c = "While creating a new version " + std::to_string(version) + " archive";
    if (version < 1 || version > 3) {
        throw FsError(ErrorKind::NotSupported, "Unknown archive version " + std::to_string(version)).with_context(c);
    }

    ArchiveIndex index;
    uint32_t base_magic = kArchiveMagic;

    with_context(c, [&]() {
        buffer->set_len(0);
        buffer->seek(0, SeekFrom::Start);

        std::string header(kArchiveSignature, sizeof(kArchiveSignature));
        header.push_back(static_cast<char>(version));
        buffer->write_all(header.data(), header.size());

        if (version == 3) {
            base_magic = write_v3(*buffer, files, index, progress);
        } else {
            write_v1(*buffer, files, index, progress);
        }
        buffer->flush();
    });

    auto stream = std::make_shared<ArchiveStream>();
    stream->file = std::move(buffer);
    return std::unique_ptr<ArchiveFS>(new ArchiveFS(std::move(stream), std::move(index), version, base_magic));
}

std::future<std::unique_ptr<ArchiveFS>> ArchiveFS::create_async(std::unique_ptr<File> buffer,
                                                                uint8_t version,
                                                                std::vector<ArchiveSource> files,
                                                                std::atomic<size_t>* progress) {
    return std::async(std::launch::async,
                      [buffer = std::move(buffer), version, files = std::move(files), progress]() mutable {
                          return from_buffer_and_files(std::move(buffer), version, files, progress);
                      });
}

size_t ArchiveFS::file_count() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_.file_count();
}

std::unique_ptr<File> ArchiveFS::open_file(const std::string& path, OpenFlags flags) {
    std::string normalized = normalize_path(path);
    std::shared_lock<std::shared_mutex> lock(index_mutex_);

    const ArchiveEntry* entry = index_.lookup_file(normalized);
    if (!entry) {
        if (has_flag(flags, OpenFlags::Create) && !index_.lookup_dir(normalized)) {
            throw FsError(ErrorKind::NotSupported, "Cannot create " + path + " inside an archive");
        }
        throw FsError(ErrorKind::NotExist, path);
    }
    if (has_flag(flags, OpenFlags::Truncate) && entry->size != 0) {
        throw FsError(ErrorKind::NotSupported, "Cannot truncate " + path + " inside an archive");
    }

    return std::make_unique<ArchiveFile>(stream_, *entry, has_flag(flags, OpenFlags::Read),
                                         has_flag(flags, OpenFlags::Write));
}

Metadata ArchiveFS::metadata(const std::string& path) {
    std::string normalized = normalize_path(path);
    std::shared_lock<std::shared_mutex> lock(index_mutex_);

    if (const ArchiveEntry* entry = index_.lookup_file(normalized)) {
        return Metadata{true, entry->size};
    }
    if (const ArchiveDirectory* dir = index_.lookup_dir(normalized)) {
        return Metadata{false, dir->child_count()};
    }
    throw FsError(ErrorKind::NotExist, path);
}

bool ArchiveFS::exists(const std::string& path) {
    std::string normalized = normalize_path(path);
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_.lookup_file(normalized) != nullptr || index_.lookup_dir(normalized) != nullptr;
}

void ArchiveFS::create_dir(const std::string& path) {
    throw FsError(ErrorKind::NotSupported, "Cannot create directory " + path + " inside an archive");
}

void ArchiveFS::remove_dir(const std::string& path) {
    throw FsError(ErrorKind::NotSupported, "Cannot remove directory " + path + " from an archive");
}

void ArchiveFS::remove_file(const std::string& path) {
    throw FsError(ErrorKind::NotSupported, "Cannot remove file " + path + " from an archive");
}

void ArchiveFS::rename(const std::string& from, const std::string& to) {
    throw FsError(ErrorKind::NotSupported, "Cannot rename " + from + " to " + to + " inside an archive");
}

std::vector<DirEntry> ArchiveFS::read_dir(const std::string& path) {
    std::string normalized = normalize_path(path);
    std::shared_lock<std::shared_mutex> lock(index_mutex_);

    const ArchiveDirectory* dir = index_.lookup_dir(normalized);
    if (!dir) {
        if (index_.lookup_file(normalized)) {
            throw io_error("Failed to read directory " + path, ENOTDIR);
        }
        throw FsError(ErrorKind::NotExist, path);
    }

    std::vector<DirEntry> entries;
    entries.reserve(dir->child_count());
    for (const auto& entry : dir->dirs()) {
        entries.push_back(DirEntry{join_path(normalized, entry.first), Metadata{false, entry.second->child_count()}});
    }
    for (const auto& entry : dir->files()) {
        entries.push_back(DirEntry{join_path(normalized, entry.first), Metadata{true, entry.second.size}});
    }
    return entries;
}

} // namespace rgss_vfs
