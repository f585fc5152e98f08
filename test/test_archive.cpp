#include <doctest/doctest.h>
#include <jam_image/jam_image.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void put_name(std::vector<std::uint8_t>& out, const std::string& name) {
    std::vector<std::uint8_t> field(jam_image::jam_archive::NAME_SIZE, 0);
    std::copy(name.begin(), name.end(), field.begin());
    out.insert(out.end(), field.begin(), field.end());
}

// LJAM
//   A.BMP        "abc"
//   SUB/
//     B.TXT      "xy"
std::vector<std::uint8_t> make_archive(std::uint32_t sub_offset = 48,
                                       const std::string& sub_file = "B.TXT") {
    std::vector<std::uint8_t> data = {'L', 'J', 'A', 'M'};

    put_u32(data, 1);           // 4: root files
    put_name(data, "A.BMP");    // 8
    put_u32(data, 76);
    put_u32(data, 3);
    put_u32(data, 1);           // 28: root folders
    put_name(data, "SUB");      // 32
    put_u32(data, sub_offset);

    put_u32(data, 1);           // 48: SUB files
    put_name(data, sub_file);   // 52
    put_u32(data, 79);
    put_u32(data, 2);
    put_u32(data, 0);           // 72: SUB folders

    data.insert(data.end(), {'a', 'b', 'c'});  // 76
    data.insert(data.end(), {'x', 'y'});       // 79
    return data;
}

// LJAM with folders nested depth levels deep, each named "D", and no files
std::vector<std::uint8_t> make_nested_archive(std::size_t depth) {
    std::vector<std::uint8_t> data = {'L', 'J', 'A', 'M'};
    for (std::size_t i = 0; i < depth; ++i) {
        put_u32(data, 0);
        put_u32(data, 1);
        put_name(data, "D");
        put_u32(data, static_cast<std::uint32_t>(4 + 24 * (i + 1)));
    }
    put_u32(data, 0);
    put_u32(data, 0);
    return data;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("JAM archive: sniff") {
    CHECK(jam_image::jam_archive::sniff(make_archive()));
    CHECK_FALSE(jam_image::jam_archive::sniff(std::vector<std::uint8_t>{'L', 'J', 'A'}));
    CHECK_FALSE(jam_image::jam_archive::sniff(std::vector<std::uint8_t>{'J', 'A', 'M', 'L'}));
}

TEST_CASE("JAM archive: list") {
    const auto data = make_archive();
    REQUIRE(data.size() == 81);

    std::vector<jam_image::archive_entry> entries;
    REQUIRE(jam_image::jam_archive::list(data, entries).ok);
    REQUIRE(entries.size() == 3);

    CHECK(entries[0].path == "A.BMP");
    CHECK_FALSE(entries[0].is_directory);
    CHECK(entries[0].offset == 76);
    CHECK(entries[0].size == 3);

    CHECK(entries[1].path == "SUB");
    CHECK(entries[1].is_directory);
    CHECK(entries[1].offset == 48);

    CHECK(entries[2].path == "SUB/B.TXT");
    CHECK(entries[2].size == 2);
}

TEST_CASE("JAM archive: deepest accepted nesting") {
    const auto data = make_nested_archive(jam_image::jam_archive::MAX_FOLDER_DEPTH);

    std::vector<jam_image::archive_entry> entries;
    REQUIRE(jam_image::jam_archive::list(data, entries).ok);
    REQUIRE(entries.size() == jam_image::jam_archive::MAX_FOLDER_DEPTH);

    std::string deepest = "D";
    for (std::size_t i = 1; i < jam_image::jam_archive::MAX_FOLDER_DEPTH; ++i) {
        deepest += "/D";
    }
    CHECK(entries.back().path == deepest);
    CHECK(entries.back().is_directory);
}

TEST_CASE("JAM archive: contents") {
    const auto data = make_archive();
    std::vector<jam_image::archive_entry> entries;
    REQUIRE(jam_image::jam_archive::list(data, entries).ok);

    auto first = jam_image::jam_archive::contents(data, entries[0]);
    CHECK(std::string(first.begin(), first.end()) == "abc");

    auto second = jam_image::jam_archive::contents(data, entries[2]);
    CHECK(std::string(second.begin(), second.end()) == "xy");

    CHECK(jam_image::jam_archive::contents(data, entries[1]).empty());

    jam_image::archive_entry outside;
    outside.offset = 80;
    outside.size = 2;
    CHECK(jam_image::jam_archive::contents(data, outside).empty());
}

TEST_CASE("JAM archive: malformed archives") {
    std::vector<jam_image::archive_entry> entries;

    SUBCASE("Bad signature") {
        auto data = make_archive();
        data[0] = 'X';
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::invalid_format);
    }

    SUBCASE("Folder pointing back at the root") {
        auto data = make_archive(4);
        auto result = jam_image::jam_archive::list(data, entries);
        CHECK(result.error == jam_image::decode_error::invalid_format);
        CHECK(entries.empty());
    }

    SUBCASE("Name escaping the destination") {
        auto data = make_archive(48, "..");
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::invalid_format);

        data = make_archive(48, "A/B");
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::invalid_format);
    }

    SUBCASE("File contents past the end") {
        auto data = make_archive();
        data.pop_back();
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::truncated_data);
    }

    SUBCASE("Folder record past the end") {
        auto data = make_archive(1000);
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::truncated_data);
    }

    SUBCASE("Record count larger than the archive") {
        std::vector<std::uint8_t> data = {'L', 'J', 'A', 'M'};
        put_u32(data, 50);
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::truncated_data);
    }

    SUBCASE("Folders nested too deep") {
        const auto data = make_nested_archive(jam_image::jam_archive::MAX_FOLDER_DEPTH + 1);
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::invalid_format);

        const auto chain = make_nested_archive(20000);
        CHECK(jam_image::jam_archive::list(chain, entries).error == jam_image::decode_error::invalid_format);
        CHECK(entries.empty());
    }

    SUBCASE("Signature only") {
        const std::vector<std::uint8_t> data = {'L', 'J', 'A', 'M'};
        CHECK(jam_image::jam_archive::list(data, entries).error == jam_image::decode_error::truncated_data);
    }
}

TEST_CASE("JAM archive: extract") {
    const auto data = make_archive();
    const auto dest = std::filesystem::temp_directory_path() / "jam_image_test_extract";
    std::filesystem::remove_all(dest);

    std::vector<jam_image::archive_entry> extracted;
    auto result = jam_image::jam_archive::extract(data, dest, &extracted);

    CHECK(result.ok);
    CHECK(extracted.size() == 3);
    CHECK(std::filesystem::is_directory(dest / "SUB"));
    CHECK(read_text(dest / "A.BMP") == "abc");
    CHECK(read_text(dest / "SUB" / "B.TXT") == "xy");

    std::filesystem::remove_all(dest);
}
