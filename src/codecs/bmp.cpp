#include <jam_image/codecs/bmp.hpp>
#include <formats/bmp/bmp.hh>
#include "byte_io.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <limits>
#include <string>

namespace jam_image {

namespace {

// BMP signature: "BM"
constexpr std::uint8_t BMP_SIGNATURE[] = {'B', 'M'};

constexpr std::uint32_t CORE_HEADER_SIZE = 12;

} // namespace

bool bmp_codec::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 2) {
        return false;
    }
    return data[0] == BMP_SIGNATURE[0] && data[1] == BMP_SIGNATURE[1];
}

decode_result bmp_codec::inspect(std::span<const std::uint8_t> data, bmp_info& info) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::invalid_format, "Not a valid BMP file");
    }
    if (data.size() < FILE_HEADER_SIZE + CORE_HEADER_SIZE) {
        return decode_result::failure(decode_error::truncated_data, "BMP header truncated");
    }

    const std::uint8_t* ptr = data.data();
    const std::uint8_t* end = data.data() + data.size();

    bmp_info result;
    try {
        auto file_header = formats::bmp::bmp_file_header::read(ptr, end);
        result.data_offset = file_header.data_offset;

        // Peek at the info header size to pick the layout
        const std::uint8_t* info_start = ptr;
        result.header_size = formats::bmp::read_uint32(ptr, end);
        ptr = info_start;

        if (result.header_size == CORE_HEADER_SIZE) {
            auto header = formats::bmp::bmp_core_header::read(ptr, end);
            result.width = header.width;
            result.height = header.height < 0 ? -header.height : header.height;
            result.top_down = header.height < 0;
            result.bits_per_pixel = header.bits_per_pixel;
            result.compression = BI_RGB;
        } else if (result.header_size >= INFO_HEADER_SIZE) {
            auto header = formats::bmp::bmp_info_header::read(ptr, end);
            result.width = header.width;
            result.height = header.height < 0 ? -header.height : header.height;
            result.top_down = header.height < 0;
            result.bits_per_pixel = header.bits_per_pixel;
            result.compression = header.compression;
        } else {
            return decode_result::failure(decode_error::invalid_format,
                "Unsupported BMP info header size: " + std::to_string(result.header_size));
        }
    } catch (const std::exception& e) {
        return decode_result::failure(decode_error::invalid_format, e.what());
    }

    info = result;
    return decode_result::success();
}

std::size_t bmp_codec::palette_slots(const dib_image& image) noexcept {
    if (image.palette_entries() == 0) {
        return 0;
    }
    return image.bits_per_pixel == 4 ? 16 : 256;
}

std::vector<std::uint8_t> bmp_codec::encode(const dib_image& image) {
    if (image.width < 0 || image.height < 0) {
        return {};
    }

    const std::size_t image_size = image.stride() * static_cast<std::size_t>(image.height);
    if (image.pixels.size() != image_size) {
        return {};
    }

    const std::size_t slots = palette_slots(image);
    const std::size_t data_offset = FILE_HEADER_SIZE + INFO_HEADER_SIZE + slots * 4;
    const std::size_t file_size = data_offset + image_size;
    if (file_size > std::numeric_limits<std::uint32_t>::max()) {
        return {};
    }

    std::vector<std::uint8_t> out;
    out.reserve(file_size);

    // BITMAPFILEHEADER
    out.push_back(BMP_SIGNATURE[0]);
    out.push_back(BMP_SIGNATURE[1]);
    write_le32(out, static_cast<std::uint32_t>(file_size));
    write_le16(out, 0);
    write_le16(out, 0);
    write_le32(out, static_cast<std::uint32_t>(data_offset));

    // BITMAPINFOHEADER, positive height: bottom-up rows
    write_le32(out, static_cast<std::uint32_t>(INFO_HEADER_SIZE));
    write_le32_signed(out, image.width);
    write_le32_signed(out, image.height);
    write_le16(out, 1);
    write_le16(out, static_cast<std::uint16_t>(image.bits_per_pixel));
    write_le32(out, BI_RGB);
    write_le32(out, static_cast<std::uint32_t>(image_size));
    write_le32_signed(out, 0);
    write_le32_signed(out, 0);
    write_le32(out, static_cast<std::uint32_t>(slots));
    write_le32(out, static_cast<std::uint32_t>(slots));

    // Palette, zero-filled past the source entries
    const std::size_t copied = std::min(slots, image.palette_entries()) * 4;
    out.insert(out.end(), image.palette.begin(), image.palette.begin() + static_cast<std::ptrdiff_t>(copied));
    out.resize(data_offset, 0);

    out.insert(out.end(), image.pixels.begin(), image.pixels.end());
    return out;
}

bool save_bmp(const dib_image& image, const std::filesystem::path& path) {
    auto bmp_data = bmp_codec::encode(image);
    if (bmp_data.empty()) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(bmp_data.data()),
               static_cast<std::streamsize>(bmp_data.size()));

    return file.good();
}

} // namespace jam_image
