#include <algorithm>
#include <cassert>
#include <string>

#include "archive_fs.hpp"
#include "archive_tools.hpp"
#include "error.hpp"
#include "host_fs.hpp"
#include "overlay_fs.hpp"
#include "test_util.hpp"

using namespace rgss_vfs;

template<typename F>
static ErrorKind error_kind_of(F&& f) {
    try {
        f();
    } catch (const FsError& e) {
        return e.kind();
    }
    assert(false && "expected an FsError");
    return ErrorKind::IO;
}

static std::vector<std::string> names_of(const std::vector<DirEntry>& entries) {
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.file_name());
    }
    std::sort(names.begin(), names.end());
    return names;
}

int main() {
    TempDir tmp;
    const auto& root = tmp.path();

    // An empty overlay has nothing to forward to.
    {
        OverlayFS overlay;
        assert(overlay.layer_count() == 0);
        assert(error_kind_of([&]() { overlay.exists("x.txt"); }) == ErrorKind::NoFilesystems);
        assert(error_kind_of([&]() { overlay.read_dir(""); }) == ErrorKind::NoFilesystems);
        assert(error_kind_of([&]() { overlay.create_dir("Data"); }) == ErrorKind::NoFilesystems);
        assert(error_kind_of([&]() { overlay.open_file("x.txt", OpenFlags::Read); }) == ErrorKind::NoFilesystems);
    }

    write_host_file(root / "a" / "x.txt", "from a");
    write_host_file(root / "a" / "Data" / "Map001.json", "a map");
    write_host_file(root / "b" / "x.txt", "from b");
    write_host_file(root / "b" / "y.txt", "only b");
    write_host_file(root / "b" / "Data" / "Map002.json", "b map");
    write_host_file(root / "c" / "Data" / "Map002.json", "archived map");
    write_host_file(root / "c" / "Graphics" / "Title.png", "png");

    // Third layer is an archive built from c/
    {
        HostFS c(root / "c");
        auto buffer = HostFile::open(root / "c.rgss3a", OpenFlags::Read | OpenFlags::Write | OpenFlags::Create);
        ArchiveFS::from_buffer_and_files(std::move(buffer), 3, collect_sources(c));
    }

    OverlayFS overlay;
    overlay.push_layer(std::make_unique<HostFS>(root / "a"));
    overlay.push_layer(std::make_unique<HostFS>(root / "b"));
    overlay.push_layer(std::make_unique<ArchiveFS>(HostFile::open(root / "c.rgss3a", OpenFlags::Read)));
    assert(overlay.layer_count() == 3);

    // Earlier layers win
    assert(overlay.read_to_string("x.txt") == "from a");
    assert(overlay.read_to_string("y.txt") == "only b");
    assert(overlay.read_to_string("Data/Map002.json") == "b map");
    assert(overlay.read_to_string("Graphics/Title.png") == "png");
    assert(overlay.metadata("x.txt").size == 6);
    assert(overlay.exists("Graphics"));
    assert(!overlay.exists("missing.txt"));
    assert(error_kind_of([&]() { overlay.metadata("missing.txt"); }) == ErrorKind::NotExist);
    assert(error_kind_of([&]() { overlay.open_file("missing.txt", OpenFlags::Read); }) == ErrorKind::NotExist);

    // Listings merge every layer, without duplicates
    {
        auto names = names_of(overlay.read_dir(""));
        assert((names == std::vector<std::string>{"Data", "Graphics", "x.txt", "y.txt"}));
        names = names_of(overlay.read_dir("Data"));
        assert((names == std::vector<std::string>{"Map001.json", "Map002.json"}));

        auto entries = overlay.read_dir("");
        auto x = std::find_if(entries.begin(), entries.end(), [](const DirEntry& e) { return e.file_name() == "x.txt"; });
        assert(x != entries.end());
        assert(x->metadata.size == 6);
        assert(error_kind_of([&]() { overlay.read_dir("Fonts"); }) == ErrorKind::NotExist);
    }

    // Writes only ever reach the first layer
    {
        overlay.write("z.txt", "new");
        assert(read_host_file(root / "a" / "z.txt") == "new");
        assert(!std::filesystem::exists(root / "b" / "z.txt"));

        overlay.write("y.txt", "shadowed");
        assert(read_host_file(root / "a" / "y.txt") == "shadowed");
        assert(read_host_file(root / "b" / "y.txt") == "only b");
        assert(overlay.read_to_string("y.txt") == "shadowed");

        overlay.create_dir("Audio");
        assert(std::filesystem::is_directory(root / "a" / "Audio"));

        overlay.rename("z.txt", "Audio/z.txt");
        assert(std::filesystem::exists(root / "a" / "Audio" / "z.txt"));

        // The archive file is only visible through a lower layer; removing
        // it from the top layer does not fall through.
        assert(error_kind_of([&]() { overlay.remove_file("Graphics/Title.png"); }) == ErrorKind::NotExist);
        assert(overlay.exists("Graphics/Title.png"));
        assert(error_kind_of([&]() {
            overlay.open_file("Graphics/Title.png", OpenFlags::Read | OpenFlags::Write);
        }) == ErrorKind::NotExist);
        assert(error_kind_of([&]() { overlay.open_file("Graphics/Title.png", OpenFlags::Write); }) == ErrorKind::NotExist);
        assert(overlay.read_to_string("Graphics/Title.png") == "png");
        assert(!std::filesystem::exists(root / "a" / "Graphics"));

        overlay.remove_file("y.txt");
        assert(overlay.read_to_string("y.txt") == "only b");
        overlay.remove_dir("Audio");
        assert(!overlay.exists("Audio"));
    }

    return 0;
}
