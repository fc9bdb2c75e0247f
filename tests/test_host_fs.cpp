#include <algorithm>
#include <cassert>
#include <cstring>

#include "error.hpp"
#include "host_fs.hpp"
#include "test_util.hpp"

using namespace rgss_vfs;

static ErrorKind error_kind_of(void (*f)(HostFS&), HostFS& fs) {
    try {
        f(fs);
    } catch (const FsError& e) {
        return e.kind();
    }
    assert(false && "expected an FsError");
    return ErrorKind::IO;
}

int main() {
    TempDir tmp;
    HostFS fs(tmp.path());

    // Write, read back, stat
    {
        fs.create_dir("Data");
        fs.write("Data/Map001.json", "{\"id\":1}");
        assert(fs.exists("Data"));
        assert(fs.exists("/Data/Map001.json"));
        assert(!fs.exists("Data/Map002.json"));

        Metadata metadata = fs.metadata("Data/Map001.json");
        assert(metadata.is_file);
        assert(metadata.size == 8);
        assert(!fs.metadata("Data").is_file);
        assert(fs.read_to_string("Data/Map001.json") == "{\"id\":1}");
    }

    // Seek, partial overwrite, set_len
    {
        auto file = fs.open_file("Data/Map001.json", OpenFlags::Read | OpenFlags::Write);
        assert(file->seek(2, SeekFrom::Start) == 2);
        file->write_all("ID", 2);
        assert(file->stream_position() == 4);
        assert(file->seek(-1, SeekFrom::End) == 7);
        char c = 0;
        file->read_exact(&c, 1);
        assert(c == '}');
        file->set_len(4);
        assert(file->metadata().size == 4);
    }
    assert(fs.read_to_string("Data/Map001.json") == "{\"ID");

    // Async read
    {
        auto file = fs.open_file("Data/Map001.json", OpenFlags::Read);
        char buf[16] = {0};
        auto future = file->read_async(buf, sizeof(buf));
        assert(future.get() == 4);
        assert(std::memcmp(buf, "{\"ID", 4) == 0);
    }

    // Listing uses paths relative to the root
    {
        fs.write("Data/Map002.json", "");
        auto entries = fs.read_dir("Data");
        assert(entries.size() == 2);
        std::sort(entries.begin(), entries.end(), [](const DirEntry& a, const DirEntry& b) {
            return a.path < b.path;
        });
        assert(entries[0].path == "Data/Map001.json");
        assert(entries[0].file_name() == "Map001.json");
        assert(entries[1].metadata.is_file);
        assert(entries[1].metadata.size == 0);
    }

    // Rename and remove
    {
        fs.rename("Data/Map002.json", "Data/Map003.json");
        assert(!fs.exists("Data/Map002.json"));
        assert(fs.exists("Data/Map003.json"));
        fs.remove("Data/Map003.json");
        assert(!fs.exists("Data/Map003.json"));
        fs.remove_dir("Data");
        assert(!fs.exists("Data"));
    }

    // Missing paths report NotExist, everything else IO
    {
        assert(error_kind_of([](HostFS& f) { f.metadata("missing"); }, fs) == ErrorKind::NotExist);
        assert(error_kind_of([](HostFS& f) { f.open_file("missing", OpenFlags::Read); }, fs) == ErrorKind::NotExist);
        assert(error_kind_of([](HostFS& f) { f.read_dir("missing"); }, fs) == ErrorKind::NotExist);
        fs.create_dir("Audio");
        assert(error_kind_of([](HostFS& f) { f.create_dir("Audio"); }, fs) == ErrorKind::IO);
        assert(error_kind_of([](HostFS& f) { f.remove_file("Audio"); }, fs) == ErrorKind::IO);
    }

    // Scratch files are readable and writable
    {
        auto scratch = HostFile::temporary();
        scratch->write_all("scratch", 7);
        scratch->seek(0, SeekFrom::Start);
        auto data = scratch->read_to_end();
        assert(std::string(data.begin(), data.end()) == "scratch");
    }

    return 0;
}
