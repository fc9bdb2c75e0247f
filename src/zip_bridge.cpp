#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>

#include "zip_bridge.hpp"
#include "archive_tools.hpp"
#include "error.hpp"
#include "utils.hpp"

namespace rgss_vfs {

namespace {

struct ZipStreamSource {
    ArchiveSource source;
    std::unique_ptr<File> file;
    bool finished = false;
    std::atomic<size_t>* progress = nullptr;
    zip_error_t error;
};

zip_int64_t zip_stream_source_cb(void* userdata, void* data, zip_uint64_t len, zip_source_cmd_t cmd) {
    ZipStreamSource* stream = static_cast<ZipStreamSource*>(userdata);

    switch (cmd) {
        case ZIP_SOURCE_OPEN: {
            try {
                stream->file = stream->source.open();
            } catch (const std::exception& e) {
                std::cerr << "\nError: Failed to open " << stream->source.path << ": " << e.what() << "\n";
                zip_error_set(&stream->error, ZIP_ER_OPEN, 0);
                return -1;
            }
            stream->finished = false;
            return 0;
        }
        case ZIP_SOURCE_READ: {
            if (!stream->file) {
                zip_error_set(&stream->error, ZIP_ER_INVAL, 0);
                return -1;
            }
            try {
                size_t n = stream->file->read(static_cast<char*>(data), static_cast<size_t>(len));
                if (n == 0) {
                    stream->finished = true;
                }
                return static_cast<zip_int64_t>(n);
            } catch (const std::exception& e) {
                std::cerr << "\nError: Failed to read " << stream->source.path << ": " << e.what() << "\n";
                zip_error_set(&stream->error, ZIP_ER_READ, 0);
                return -1;
            }
        }
        case ZIP_SOURCE_CLOSE: {
            stream->file.reset();
            if (stream->finished && stream->progress) {
                stream->progress->fetch_add(1);
            }
            return 0;
        }
        case ZIP_SOURCE_STAT: {
            if (len < sizeof(zip_stat_t)) {
                zip_error_set(&stream->error, ZIP_ER_INVAL, 0);
                return -1;
            }
            zip_stat_t* st = static_cast<zip_stat_t*>(data);
            zip_stat_init(st);
            st->size = stream->source.size;
            st->valid = ZIP_STAT_SIZE;
            return sizeof(zip_stat_t);
        }
        case ZIP_SOURCE_ERROR:
            return zip_error_to_data(&stream->error, data, len);
        case ZIP_SOURCE_FREE:
            stream->file.reset();
            zip_error_fini(&stream->error);
            delete stream;
            return 0;
        case ZIP_SOURCE_SUPPORTS:
            return ZIP_SOURCE_SUPPORTS_READABLE | ZIP_SOURCE_MAKE_COMMAND_BITMASK(ZIP_SOURCE_SUPPORTS);
        default:
            zip_error_set(&stream->error, ZIP_ER_OPNOTSUPP, 0);
            return -1;
    }
}

std::string zip_open_error(int err) {
    zip_error_t error;
    zip_error_init_with_code(&error, err);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

} // namespace

size_t export_zip(FileSystem& fs, const std::string& zip_path, std::atomic<size_t>* progress) {
    auto sources = collect_sources(fs);

    int err = 0;
    zip_t* output_zip = zip_open(zip_path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!output_zip) {
        throw FsError(ErrorKind::IO, "Failed to create ZIP " + zip_path + ": " + zip_open_error(err));
    }

    for (auto& source : sources) {
        ZipStreamSource* stream = new ZipStreamSource();
        stream->source = std::move(source);
        stream->progress = progress;
        zip_error_init(&stream->error);
        std::string name = stream->source.path;

        zip_source_t* zsource = zip_source_function(output_zip, zip_stream_source_cb, stream);
        if (!zsource) {
            zip_error_fini(&stream->error);
            delete stream;
            zip_discard(output_zip);
            throw FsError(ErrorKind::IO, "Failed to create ZIP source for " + name);
        }

        zip_int64_t idx = zip_file_add(output_zip, name.c_str(), zsource, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
        if (idx < 0) {
            std::string message = zip_strerror(output_zip);
            zip_source_free(zsource);
            zip_discard(output_zip);
            throw FsError(ErrorKind::IO, "Failed to add " + name + " to ZIP: " + message);
        }

        // Set compression method to STORE (no compression)
        if (zip_set_file_compression(output_zip, idx, ZIP_CM_STORE, 0) != 0) {
            std::cerr << "Warning: Failed to set compression method for: " << name << "\n";
        }
    }

    if (zip_close(output_zip) != 0) {
        std::string message = zip_strerror(output_zip);
        zip_discard(output_zip);
        throw FsError(ErrorKind::IO, "Failed to finalize ZIP " + zip_path + ": " + message);
    }
    return sources.size();
}


ZipEntryFile::ZipEntryFile(zip_file_t* file, uint64_t size): file_(file), size_(size), position_(0) { }

ZipEntryFile::~ZipEntryFile() {
    zip_fclose(file_);
}

size_t ZipEntryFile::read(char* buf, size_t len) {
    zip_int64_t n = zip_fread(file_, buf, len);
    if (n < 0) {
        throw FsError(ErrorKind::IO, std::string("Failed to read ZIP entry: ") + zip_file_strerror(file_));
    }
    position_ += static_cast<uint64_t>(n);
    return static_cast<size_t>(n);
}

size_t ZipEntryFile::write(const char* buf, size_t len) {
    (void) buf;
    (void) len;
    throw FsError(ErrorKind::NotSupported, "ZIP entries are read-only");
}

uint64_t ZipEntryFile::seek(int64_t offset, SeekFrom whence) {
    if (whence == SeekFrom::Current && offset == 0) {
        return position_;
    }
    throw FsError(ErrorKind::NotSupported, "ZIP entries can only be read sequentially");
}

void ZipEntryFile::flush() { }

Metadata ZipEntryFile::metadata() const {
    return Metadata{true, size_};
}

void ZipEntryFile::set_len(uint64_t new_size) {
    (void) new_size;
    throw FsError(ErrorKind::NotSupported, "ZIP entries are read-only");
}


ZipReader::ZipReader(const std::string& path) {
    int err = 0;
    zip_ = zip_open(path.c_str(), ZIP_RDONLY, &err);
    if (!zip_) {
        throw FsError(ErrorKind::IO, "Failed to open ZIP " + path + ": " + zip_open_error(err));
    }
}

ZipReader::~ZipReader() {
    zip_close(zip_);
}

std::vector<ArchiveSource> ZipReader::sources() {
    std::vector<ArchiveSource> sources;
    zip_int64_t num_entries = zip_get_num_entries(zip_, 0);

    for (zip_int64_t i = 0; i < num_entries; i++) {
        zip_stat_t st;
        zip_stat_init(&st);

        if (zip_stat_index(zip_, static_cast<zip_uint64_t>(i), 0, &st) != 0) {
            throw FsError(ErrorKind::IO, "Failed to stat ZIP entry " + std::to_string(i) + ": " + zip_strerror(zip_));
        }

        const char* name = st.name;
        size_t name_len = std::strlen(name);

        // Skip directory entries
        if (name_len > 0 && name[name_len - 1] == '/') {
            continue;
        }
        if (st.size > UINT32_MAX) {
            throw FsError(ErrorKind::NotSupported, std::string("ZIP entry ") + name + " is too large for an archive");
        }

        zip_t* zip = zip_;
        zip_uint64_t index = static_cast<zip_uint64_t>(i);
        zip_uint64_t size = st.size;
        sources.push_back(ArchiveSource{normalize_path(name), static_cast<uint32_t>(size), [zip, index, size]() {
            zip_file_t* zf = zip_fopen_index(zip, index, 0);
            if (!zf) {
                throw FsError(ErrorKind::IO, "Failed to open ZIP entry " + std::to_string(index) + ": " +
                              zip_strerror(zip));
            }
            return std::unique_ptr<File>(new ZipEntryFile(zf, size));
        }});
    }
    return sources;
}

}
