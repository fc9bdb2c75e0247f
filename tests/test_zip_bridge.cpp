#include <cassert>
#include <string>

#include <zip.h>

#include "archive_fs.hpp"
#include "archive_tools.hpp"
#include "error.hpp"
#include "host_fs.hpp"
#include "test_util.hpp"
#include "zip_bridge.hpp"

using namespace rgss_vfs;

int main() {
    TempDir tmp;
    const auto& root = tmp.path();

    std::string big(200000, '\0');
    for (size_t i = 0; i < big.size(); i++) {
        big[i] = static_cast<char>((i * 31) & 0xFF);
    }
    write_host_file(root / "src" / "Data" / "Map001.rxdata", big);
    write_host_file(root / "src" / "Graphics" / "Pictures" / "Sky.png", "sky");
    write_host_file(root / "src" / "Game.ini", "[Game]");

    {
        HostFS source(root / "src");
        auto buffer = HostFile::open(root / "Game.rgss3a", OpenFlags::Read | OpenFlags::Write | OpenFlags::Create);
        ArchiveFS::from_buffer_and_files(std::move(buffer), 3, collect_sources(source));
    }

    // Archive -> ZIP
    ArchiveFS archive(HostFile::open(root / "Game.rgss3a", OpenFlags::Read));
    std::atomic<size_t> progress(0);
    size_t written = export_zip(archive, (root / "Game.zip").string(), &progress);
    assert(written == 3);
    assert(progress.load() == 3);

    {
        int err = 0;
        zip_t* za = zip_open((root / "Game.zip").c_str(), ZIP_RDONLY, &err);
        assert(za != nullptr);
        assert(zip_get_num_entries(za, 0) == 3);

        zip_stat_t st;
        zip_stat_init(&st);
        assert(zip_stat(za, "Data/Map001.rxdata", 0, &st) == 0);
        assert(st.size == big.size());
        assert(st.comp_method == ZIP_CM_STORE);

        zip_file_t* zf = zip_fopen(za, "Graphics/Pictures/Sky.png", 0);
        assert(zf != nullptr);
        char buf[8] = {0};
        assert(zip_fread(zf, buf, sizeof(buf)) == 3);
        assert(std::string(buf, 3) == "sky");
        zip_fclose(zf);
        zip_close(za);
    }

    // ZIP -> archive
    {
        ZipReader reader((root / "Game.zip").string());
        auto sources = reader.sources();
        assert(sources.size() == 3);

        auto buffer = HostFile::open(root / "Imported.rgss2a", OpenFlags::Read | OpenFlags::Write | OpenFlags::Create);
        auto imported = ArchiveFS::from_buffer_and_files(std::move(buffer), 2, sources);
        assert(imported->file_count() == 3);
    }

    ArchiveFS imported(HostFile::open(root / "Imported.rgss2a", OpenFlags::Read));
    assert(imported.version() == 2);
    auto data = imported.read("data/../Data/Map001.rxdata");
    assert(std::string(data.begin(), data.end()) == big);
    assert(imported.read_to_string("Graphics/Pictures/Sky.png") == "sky");
    assert(imported.read_to_string("Game.ini") == "[Game]");

    // ZIP entries are sequential and read-only
    {
        ZipReader reader((root / "Game.zip").string());
        auto sources = reader.sources();
        auto file = sources[0].open();
        assert(file->metadata().is_file);
        bool threw = false;
        try {
            file->seek(10, SeekFrom::Start);
        } catch (const FsError& e) {
            threw = e.kind() == ErrorKind::NotSupported;
        }
        assert(threw);
    }

    bool threw = false;
    try {
        ZipReader missing((root / "missing.zip").string());
    } catch (const FsError& e) {
        threw = e.kind() == ErrorKind::IO;
    }
    assert(threw);

    return 0;
}
