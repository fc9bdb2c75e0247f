#include <cassert>
#include <tuple>

#include "utils.hpp"

using rgss_vfs::PathSplit;

static void expect_single_segment(PathSplit& split, size_t start, size_t end) {
    auto& segments = split.segments();
    assert(segments.size() == 1);
    const auto& first = segments.front();
    assert(std::get<0>(first) == start);
    assert(std::get<1>(first) == end);
}

int main() {
    {
        PathSplit split("");
        assert(!split.is_dir());
        assert(split.segments().empty());
    }
    {
        PathSplit split("..");
        assert(split.is_dir());
        assert(split.segments().empty());
    }
    {
        PathSplit split("a/..");
        assert(split.is_dir());
        assert(split.segments().empty());
    }
    {
        PathSplit split("../b");
        assert(!split.is_dir());
        expect_single_segment(split, 3, 4);
    }
    {
        PathSplit split("/Data/");
        assert(split.is_dir());
        expect_single_segment(split, 1, 5);
    }
    {
        auto components = rgss_vfs::split_components("Graphics\\Characters/./001-Fighter01.png");
        assert(components.size() == 3);
        assert(components[0] == "Graphics");
        assert(components[1] == "Characters");
        assert(components[2] == "001-Fighter01.png");
        assert(rgss_vfs::join_components(components, 1, 3) == "Characters/001-Fighter01.png");
    }
    {
        assert(rgss_vfs::normalize_path("/") == "");
        assert(rgss_vfs::normalize_path("//Data//Map001.rxdata") == "Data/Map001.rxdata");
        assert(rgss_vfs::normalize_path("Data/../Audio/BGM/") == "Audio/BGM");
        assert(rgss_vfs::parent_path("Audio/BGM/town.ogg") == "Audio/BGM");
        assert(rgss_vfs::parent_path("town.ogg") == "");
        assert(rgss_vfs::file_name("Audio/BGM/town.ogg") == "town.ogg");
        assert(rgss_vfs::join_path("", "Data") == "Data");
        assert(rgss_vfs::join_path("Data", "Map.json") == "Data/Map.json");
    }
    {
        assert(rgss_vfs::to_lowercase("Data/MAP001.RXDATA") == "data/map001.rxdata");
        assert(rgss_vfs::to_lowercase("\xC3\x84rger") == "\xC3\x84rger");

        auto ext = rgss_vfs::split_extension("Map001.rxdata");
        assert(ext.first == "Map001" && ext.second == "rxdata");
        ext = rgss_vfs::split_extension("archive.tar.gz");
        assert(ext.first == "archive.tar" && ext.second == "gz");
        ext = rgss_vfs::split_extension(".hidden");
        assert(ext.first == ".hidden" && ext.second.empty());
        ext = rgss_vfs::split_extension("Readme");
        assert(ext.first == "Readme" && ext.second.empty());
    }
    {
        assert(rgss_vfs::is_valid_utf8("plain"));
        assert(rgss_vfs::is_valid_utf8("\xE3\x83\x9E\xE3\x83\x83\xE3\x83\x97"));
        assert(!rgss_vfs::is_valid_utf8("\xE3\x83"));
        assert(!rgss_vfs::is_valid_utf8("\xFF"));
        assert(!rgss_vfs::is_valid_utf8("\xC0\x80"));
        assert(!rgss_vfs::is_valid_utf8("\xE0\x80\x80"));
        assert(!rgss_vfs::is_valid_utf8("\xED\xA0\x80"));
        assert(!rgss_vfs::is_valid_utf8("\xF4\x90\x80\x80"));
        assert(!rgss_vfs::is_valid_utf8("\xF0\x8F\xBF\xBF"));
        assert(rgss_vfs::is_valid_utf8("\xE0\xA0\x80"));
        assert(rgss_vfs::is_valid_utf8("\xED\x9F\xBF"));
        assert(rgss_vfs::is_valid_utf8("\xF0\x9F\x8E\xAE"));
        assert(rgss_vfs::is_valid_utf8("\xF4\x8F\xBF\xBF"));
    }
    return 0;
}
