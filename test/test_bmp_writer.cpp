#include <doctest/doctest.h>
#include <jam_image/jam_image.hpp>

#include <filesystem>
#include <fstream>
#include <vector>

namespace {

std::uint32_t le32_at(const std::vector<std::uint8_t>& data, std::size_t offset) {
    return static_cast<std::uint32_t>(data[offset]) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

std::uint16_t le16_at(const std::vector<std::uint8_t>& data, std::size_t offset) {
    return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

jam_image::dib_image make_rgb_image() {
    jam_image::dib_image image;
    image.width = 2;
    image.height = 2;
    image.bits_per_pixel = 24;
    image.pixels = {7, 8, 9, 10, 11, 12, 0, 0,
                    1, 2, 3, 4, 5, 6, 0, 0};
    return image;
}

} // namespace

TEST_CASE("BMP writer: 24 bpp header") {
    auto image = make_rgb_image();
    auto bmp = jam_image::bmp_codec::encode(image);

    REQUIRE(bmp.size() == 70);
    CHECK(bmp[0] == 'B');
    CHECK(bmp[1] == 'M');
    CHECK(le32_at(bmp, 2) == 70);      // file size
    CHECK(le32_at(bmp, 6) == 0);       // reserved
    CHECK(le32_at(bmp, 10) == 54);     // pixel data offset
    CHECK(le32_at(bmp, 14) == 40);     // info header size
    CHECK(le32_at(bmp, 18) == 2);      // width
    CHECK(le32_at(bmp, 22) == 2);      // height, positive: bottom-up
    CHECK(le16_at(bmp, 26) == 1);      // planes
    CHECK(le16_at(bmp, 28) == 24);     // bits per pixel
    CHECK(le32_at(bmp, 30) == 0);      // BI_RGB
    CHECK(le32_at(bmp, 34) == 16);     // image size
    CHECK(le32_at(bmp, 38) == 0);
    CHECK(le32_at(bmp, 42) == 0);
    CHECK(le32_at(bmp, 46) == 0);      // colors used
    CHECK(le32_at(bmp, 50) == 0);      // colors important

    const std::vector<std::uint8_t> pixels(bmp.begin() + 54, bmp.end());
    CHECK(pixels == image.pixels);
}

TEST_CASE("BMP writer: palettes") {
    SUBCASE("8 bpp always writes 256 entries") {
        jam_image::dib_image image;
        image.width = 4;
        image.height = 1;
        image.bits_per_pixel = 8;
        image.palette = {0x10, 0x20, 0x30, 0, 0x40, 0x50, 0x60, 0};
        image.pixels = {0, 1, 1, 0};

        CHECK(jam_image::bmp_codec::palette_slots(image) == 256);
        auto bmp = jam_image::bmp_codec::encode(image);

        REQUIRE(bmp.size() == 54 + 1024 + 4);
        CHECK(le32_at(bmp, 10) == 54 + 1024);
        CHECK(le32_at(bmp, 46) == 256);
        CHECK(le32_at(bmp, 50) == 256);
        CHECK(bmp[54] == 0x10);
        CHECK(bmp[58] == 0x40);
        CHECK(bmp[61] == 0);
        CHECK(bmp[62] == 0);           // unused slots are zero
        CHECK(bmp[54 + 1023] == 0);
        CHECK(bmp[54 + 1024 + 1] == 1);
    }

    SUBCASE("4 bpp writes 16 entries") {
        jam_image::dib_image image;
        image.width = 3;
        image.height = 1;
        image.bits_per_pixel = 4;
        image.palette.assign(16 * 4, 0xAA);
        image.pixels = {0x12, 0x30, 0, 0};

        CHECK(jam_image::bmp_codec::palette_slots(image) == 16);
        auto bmp = jam_image::bmp_codec::encode(image);

        REQUIRE(bmp.size() == 54 + 64 + 4);
        CHECK(le32_at(bmp, 10) == 118);
        CHECK(le32_at(bmp, 46) == 16);
        CHECK(le16_at(bmp, 28) == 4);
        CHECK(bmp[118] == 0x12);
    }

    SUBCASE("Indexed image without a palette writes none") {
        jam_image::dib_image image;
        image.width = 4;
        image.height = 1;
        image.bits_per_pixel = 8;
        image.pixels = {0, 64, 128, 255};

        CHECK(jam_image::bmp_codec::palette_slots(image) == 0);
        auto bmp = jam_image::bmp_codec::encode(image);

        REQUIRE(bmp.size() == 58);
        CHECK(le32_at(bmp, 10) == 54);
        CHECK(le32_at(bmp, 46) == 0);
    }
}

TEST_CASE("BMP writer: inconsistent images") {
    auto image = make_rgb_image();

    SUBCASE("Pixel buffer too small") {
        image.pixels.pop_back();
        CHECK(jam_image::bmp_codec::encode(image).empty());
    }

    SUBCASE("Pixel buffer too large") {
        image.pixels.push_back(0);
        CHECK(jam_image::bmp_codec::encode(image).empty());
    }

    SUBCASE("Empty image is a bare header") {
        jam_image::dib_image empty;
        empty.bits_per_pixel = 24;
        auto bmp = jam_image::bmp_codec::encode(empty);
        REQUIRE(bmp.size() == 54);
        CHECK(le32_at(bmp, 2) == 54);
        CHECK(le32_at(bmp, 34) == 0);
    }
}

TEST_CASE("BMP reader: sniff and inspect") {
    CHECK(jam_image::bmp_codec::sniff(std::vector<std::uint8_t>{'B', 'M'}));
    CHECK_FALSE(jam_image::bmp_codec::sniff(std::vector<std::uint8_t>{'M', 'B'}));
    CHECK_FALSE(jam_image::bmp_codec::sniff(std::vector<std::uint8_t>{'B'}));

    SUBCASE("Own output reads back") {
        auto bmp = jam_image::bmp_codec::encode(make_rgb_image());

        jam_image::bmp_info info;
        REQUIRE(jam_image::bmp_codec::inspect(bmp, info).ok);
        CHECK(info.width == 2);
        CHECK(info.height == 2);
        CHECK_FALSE(info.top_down);
        CHECK(info.bits_per_pixel == 24);
        CHECK(info.compression == jam_image::bmp_codec::BI_RGB);
        CHECK(info.header_size == 40);
        CHECK(info.data_offset == 54);
    }

    SUBCASE("Not a BMP") {
        const std::vector<std::uint8_t> data = {24, 0, 1, 0, 1, 0};
        jam_image::bmp_info info;
        CHECK(jam_image::bmp_codec::inspect(data, info).error == jam_image::decode_error::invalid_format);
    }

    SUBCASE("Truncated headers") {
        auto bmp = jam_image::bmp_codec::encode(make_rgb_image());
        bmp.resize(20);
        jam_image::bmp_info info;
        CHECK_FALSE(jam_image::bmp_codec::inspect(bmp, info).ok);
    }

    SUBCASE("Signature alone selects pass-through") {
        // Too short and an unknown header size: unreadable, yet still a BMP to copy
        const std::vector<std::uint8_t> stub = {'B', 'M', 0, 0};
        const std::vector<std::uint8_t> odd = {'B', 'M', 0, 0, 0, 0, 0, 0, 0, 0, 26, 0, 0, 0,
                                               20, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        jam_image::bmp_info info;
        for (const auto* data : {&stub, &odd}) {
            CHECK(jam_image::bmp_codec::sniff(*data));
            CHECK_FALSE(jam_image::bmp_codec::inspect(*data, info).ok);
            CHECK_FALSE(jam_image::jam_bitmap_decoder::sniff(*data));
        }
    }
}

TEST_CASE("BMP writer: save to file") {
    const auto path = std::filesystem::temp_directory_path() / "jam_image_test_save.bmp";
    auto image = make_rgb_image();

    REQUIRE(jam_image::save_bmp(image, path));
    auto written = read_file(path);
    std::filesystem::remove(path);

    CHECK(written == jam_image::bmp_codec::encode(image));

    jam_image::dib_image broken = image;
    broken.pixels.clear();
    CHECK_FALSE(jam_image::save_bmp(broken, path));
}
