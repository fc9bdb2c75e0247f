#include <cassert>
#include <map>
#include <string>

#include "error.hpp"
#include "host_fs.hpp"
#include "path_cache_fs.hpp"
#include "test_util.hpp"

using namespace rgss_vfs;

// Forwards to a host directory and counts every call that touches it.
class CountingFS : public FileSystem {
public:
    explicit CountingFS(const std::filesystem::path& root): host_(root) { }

    inline size_t calls() const { return calls_; }
    inline size_t listings(const std::string& path) const {
        auto it = listings_.find(path);
        return it == listings_.end() ? 0 : it->second;
    }

    std::unique_ptr<File> open_file(const std::string& path, OpenFlags flags) override {
        calls_++;
        return host_.open_file(path, flags);
    }
    Metadata metadata(const std::string& path) override {
        calls_++;
        return host_.metadata(path);
    }
    bool exists(const std::string& path) override {
        calls_++;
        return host_.exists(path);
    }
    void create_dir(const std::string& path) override {
        calls_++;
        host_.create_dir(path);
    }
    void remove_dir(const std::string& path) override {
        calls_++;
        host_.remove_dir(path);
    }
    void remove_file(const std::string& path) override {
        calls_++;
        host_.remove_file(path);
    }
    void rename(const std::string& from, const std::string& to) override {
        calls_++;
        host_.rename(from, to);
    }
    std::vector<DirEntry> read_dir(const std::string& path) override {
        calls_++;
        listings_[path]++;
        return host_.read_dir(path);
    }

private:
    HostFS host_;
    size_t calls_ = 0;
    std::map<std::string, size_t> listings_;
};

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

int main() {
    TempDir tmp;
    const auto& root = tmp.path();

    write_host_file(root / "Data" / "Map001.json", "map 1");
    write_host_file(root / "Data" / "MapInfos.json", "infos");
    write_host_file(root / "Graphics" / "Characters" / "Actor1.png", "actor");
    write_host_file(root / "Graphics" / "Characters" / "Actor2.png", "actor 2");
    write_host_file(root / "Graphics" / "Faces" / "Actor1.png", "face");
    write_host_file(root / "Audio" / "BGM" / "Town.ogg", "town");
    write_host_file(root / "Audio" / "BGM" / "Town.mid", "midi");
    write_host_file(root / "a" / "b" / "c", "c");
    write_host_file(root / "a" / "b" / "d", "d");
    write_host_file(root / "Data" / "Troops.json", "troops json");
    write_host_file(root / "Data" / "Skills.json", "skills json");
    write_host_file(root / "Data" / "Items.json", "items json");

    auto counting = std::make_unique<CountingFS>(root);
    CountingFS* backend = counting.get();
    PathCacheFS fs(std::move(counting));

    // Case-insensitive resolution, idempotent and free once cached
    {
        auto real = fs.desensitize("graphics/characters/actor1.png");
        assert(real && *real == "Graphics/Characters/Actor1.png");
        size_t calls = backend->calls();

        auto again = fs.desensitize("graphics/characters/actor1.png");
        assert(again && *again == *real);
        assert(backend->calls() == calls);

        // Siblings came with the listing
        assert(*fs.desensitize("GRAPHICS/CHARACTERS/ACTOR2.PNG") == "Graphics/Characters/Actor2.png");
        assert(backend->calls() == calls);

        assert(*fs.desensitize("") == "");
        assert(*fs.desensitize("/") == "");
        assert(fs.read_to_string("gRaPhIcS/cHaRaCtErS/aCtOr1.PnG") == "actor");
    }

    // Only the uncached suffix is listed
    {
        assert(*fs.desensitize("A/B/C") == "a/b/c");
        assert(backend->listings("") == 1);
        assert(backend->listings("a") == 1);
        assert(backend->listings("a/b") == 1);

        assert(*fs.desensitize("a/B/d") == "a/b/d");
        assert(backend->listings("a") == 1);
        assert(backend->listings("a/b") == 1);

        assert(*fs.desensitize("graphics/faces/actor1.png") == "Graphics/Faces/Actor1.png");
        assert(backend->listings("") == 1);
        assert(backend->listings("Graphics") == 1);
        assert(backend->listings("Graphics/Faces") == 1);
    }

    // Extension-less lookups fall back to any extension
    {
        assert(*fs.desensitize("data/map001.json") == "Data/Map001.json");
        assert(*fs.desensitize("data/map001") == "Data/Map001.json");
        assert(fs.read_to_string("DATA/MAPINFOS") == "infos");
        auto town = fs.desensitize("audio/bgm/town");
        assert(town && (*town == "Audio/BGM/Town.mid" || *town == "Audio/BGM/Town.ogg"));
        assert(*fs.desensitize("audio/bgm/town.OGG") == "Audio/BGM/Town.ogg");
    }

    // Missing paths
    {
        assert(!fs.desensitize("data/map999.json"));
        assert(!fs.exists("Data/Map999.json"));
        assert(!fs.exists("data/map001.json/inside"));
        assert(error_kind_of([&]() { fs.metadata("nowhere/file"); }) == ErrorKind::NotExist);
        assert(error_kind_of([&]() { fs.open_file("data/map999.json", OpenFlags::Read); }) == ErrorKind::NotExist);
    }

    // Removing a directory forgets everything below it
    {
        assert(*fs.desensitize("a/B/c") == "a/b/c");
        size_t before = fs.cached_path_count();
        fs.remove_dir("A/b");
        assert(!std::filesystem::exists(root / "a" / "b"));
        assert(fs.cached_path_count() == before - 3);
        assert(!fs.desensitize("a/B/c"));
        assert(error_kind_of([&]() { fs.read_dir("a/b"); }) == ErrorKind::NotExist);
        assert(fs.read_dir("A").empty());
    }

    // Removing a file
    {
        fs.remove_file("audio/bgm/town.mid");
        assert(!std::filesystem::exists(root / "Audio" / "BGM" / "Town.mid"));
        assert(!fs.exists("audio/bgm/town.mid"));
        assert(*fs.desensitize("audio/bgm/town") == "Audio/BGM/Town.ogg");
    }

    // New entries keep the cached casing of their parents
    {
        fs.create_dir("graphics/pictures");
        assert(std::filesystem::is_directory(root / "Graphics" / "pictures"));
        assert(*fs.desensitize("GRAPHICS/PICTURES") == "Graphics/pictures");

        fs.write("Graphics/PICTURES/Sky.png", "sky");
        assert(read_host_file(root / "Graphics" / "pictures" / "Sky.png") == "sky");
        assert(*fs.desensitize("graphics/pictures/sky.png") == "Graphics/pictures/Sky.png");

        // Overwriting an existing file keeps its real name
        fs.write("data/MAP001.JSON", "map 1 v2");
        assert(read_host_file(root / "Data" / "Map001.json") == "map 1 v2");
        assert(!std::filesystem::exists(root / "Data" / "MAP001.JSON"));
    }

    // A sibling with a new extension is found next to an existing one
    {
        assert(*fs.desensitize("data/mapinfos.json") == "Data/MapInfos.json");
        write_host_file(root / "Data" / "MapInfos.rxdata", "rx");
        assert(*fs.desensitize("data/MAPINFOS.rxdata") == "Data/MapInfos.rxdata");
    }

    // Renames move the cached entry
    {
        fs.rename("graphics/pictures/sky.png", "GRAPHICS/Pictures/Clouds.png");
        assert(std::filesystem::exists(root / "Graphics" / "pictures" / "Clouds.png"));
        assert(!fs.desensitize("graphics/pictures/sky.png"));
        assert(*fs.desensitize("graphics/pictures/clouds.png") == "Graphics/pictures/Clouds.png");

        fs.rename("Graphics/pictures", "Graphics/Panoramas");
        assert(!fs.desensitize("graphics/pictures/clouds.png"));
        assert(*fs.desensitize("graphics/panoramas/clouds.png") == "Graphics/Panoramas/Clouds.png");
    }

    // A new name that only matches a sibling by extension gets its own entry
    {
        assert(*fs.desensitize("data/troops") == "Data/Troops.json");
        fs.write("data/troops", "troops plain");
        assert(read_host_file(root / "Data" / "troops") == "troops plain");
        assert(read_host_file(root / "Data" / "Troops.json") == "troops json");
        assert(*fs.desensitize("DATA/TROOPS") == "Data/troops");
        assert(fs.read_to_string("data/troops") == "troops plain");
        assert(fs.read_to_string("data/troops.json") == "troops json");

        assert(*fs.desensitize("data/skills") == "Data/Skills.json");
        fs.create_dir("data/skills");
        assert(std::filesystem::is_directory(root / "Data" / "skills"));
        assert(*fs.desensitize("DATA/SKILLS") == "Data/skills");
        assert(!fs.metadata("data/skills").is_file);
        fs.write("data/SKILLS/Fire.txt", "fire");
        assert(read_host_file(root / "Data" / "skills" / "Fire.txt") == "fire");
        assert(fs.read_to_string("data/skills/fire.txt") == "fire");
        assert(fs.read_to_string("data/skills.json") == "skills json");

        assert(*fs.desensitize("data/items") == "Data/Items.json");
        fs.write("data/Armors.txt", "armors");
        fs.rename("data/armors.txt", "DATA/Items");
        assert(read_host_file(root / "Data" / "Items") == "armors");
        assert(!fs.exists("data/armors.txt"));
        assert(*fs.desensitize("data/items") == "Data/Items");
        assert(fs.read_to_string("data/items") == "armors");
        assert(fs.read_to_string("data/items.json") == "items json");
    }

    // Changes made behind the cache's back need a rebuild
    {
        std::filesystem::rename(root / "Data" / "Map001.json", root / "Data" / "MAP001.json");
        assert(error_kind_of([&]() { fs.read_to_string("data/map001.json"); }) == ErrorKind::NotExist);

        fs.rebuild();
        assert(fs.cached_path_count() == 0);
        assert(*fs.desensitize("data/map001.json") == "Data/MAP001.json");
        assert(fs.read_to_string("data/map001.json") == "map 1 v2");
    }

    return 0;
}
