#include <jam_image/codecs/jam_bitmap.hpp>
#include <jam_image/chunk_stream.hpp>
#include <jam_image/scanline_assembler.hpp>
#include <jam_image/scratch_buffer.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <string>
#include <vector>

namespace jam_image {

namespace {

constexpr std::size_t PALETTE_ENTRY_SIZE = 3;  // blue, green, red

bool is_supported_depth(int bits_per_pixel) {
    return bits_per_pixel == 4 || bits_per_pixel == 8 ||
           bits_per_pixel == 24 || bits_per_pixel == 32;
}

void write_grayscale_palette(surface& surf, int bits_per_pixel) {
    const int count = 1 << bits_per_pixel;
    std::vector<std::uint8_t> rgb(static_cast<std::size_t>(count) * 3);
    for (int i = 0; i < count; ++i) {
        const auto level = static_cast<std::uint8_t>(i * 255 / (count - 1));
        rgb[static_cast<std::size_t>(i) * 3 + 0] = level;
        rgb[static_cast<std::size_t>(i) * 3 + 1] = level;
        rgb[static_cast<std::size_t>(i) * 3 + 2] = level;
    }
    surf.set_palette_size(count);
    surf.write_palette(0, rgb);
}

void write_indexed_palette(surface& surf, const dib_image& image) {
    const std::size_t count = image.palette_entries();
    std::vector<std::uint8_t> rgb(count * 3);
    for (std::size_t i = 0; i < count; ++i) {
        rgb[i * 3 + 0] = image.palette[i * 4 + 2];
        rgb[i * 3 + 1] = image.palette[i * 4 + 1];
        rgb[i * 3 + 2] = image.palette[i * 4 + 0];
    }
    surf.set_palette_size(static_cast<int>(count));
    surf.write_palette(0, rgb);
}

} // namespace

bool jam_bitmap_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < HEADER_SIZE) {
        return false;
    }
    if (data[0] == 'B' && data[1] == 'M') {
        return false;
    }
    return is_supported_depth(data[0] & BITS_PER_PIXEL_MASK);
}

decode_result jam_bitmap_decoder::read_header(std::span<const std::uint8_t> data,
                                              jam_bitmap_header& header,
                                              const decode_options& options) {
    if (data.size() < HEADER_SIZE) {
        return decode_result::failure(decode_error::truncated_data, "Header too short");
    }

    jam_bitmap_header result;
    result.flags = data[0];
    result.bits_per_pixel = data[0] & BITS_PER_PIXEL_MASK;
    result.width = read_le16(data.data() + 2);
    result.height = read_le16(data.data() + 4);

    if (!is_supported_depth(result.bits_per_pixel)) {
        return decode_result::failure(decode_error::unsupported_bit_depth,
            "Unsupported bits per pixel: " + std::to_string(result.bits_per_pixel));
    }

    auto dims = validate_dimensions(result.width, result.height, options);
    if (!dims) {
        return dims;
    }

    const bool has_palette = result.bits_per_pixel <= 8 && (result.flags & FLAG_NO_PALETTE) == 0;
    result.palette_size = has_palette ? data[1] + 1 : 0;

    const std::size_t palette_bytes = static_cast<std::size_t>(result.palette_size) * PALETTE_ENTRY_SIZE;
    if (data.size() - HEADER_SIZE < palette_bytes) {
        return decode_result::failure(decode_error::truncated_data,
            "Palette of " + std::to_string(result.palette_size) + " entries truncated");
    }

    result.palette.resize(static_cast<std::size_t>(result.palette_size) * 4);
    const std::uint8_t* pal = data.data() + HEADER_SIZE;
    for (int i = 0; i < result.palette_size; ++i) {
        const auto dst = static_cast<std::size_t>(i) * 4;
        result.palette[dst + 0] = pal[0];  // blue
        result.palette[dst + 1] = pal[1];  // green
        result.palette[dst + 2] = pal[2];  // red
        result.palette[dst + 3] = 0;
        pal += PALETTE_ENTRY_SIZE;
    }

    result.data_offset = HEADER_SIZE + palette_bytes;
    header = std::move(result);
    return decode_result::success();
}

decode_result jam_bitmap_decoder::decode(std::span<const std::uint8_t> data,
                                         dib_image& image,
                                         const decode_options& options) {
    jam_bitmap_header header;
    auto result = read_header(data, header, options);
    if (!result) {
        return result;
    }

    image.width = header.width;
    image.height = header.height;
    image.bits_per_pixel = header.bits_per_pixel;
    image.palette = std::move(header.palette);

    // One scratch buffer per decode; nothing carries over between images
    scratch_buffer scratch;
    byte_stream stream(data.subspan(header.data_offset));
    scanline_assembler assembler(stream, scratch, options);

    return assembler.assemble(image);
}

decode_result jam_bitmap_decoder::decode(std::span<const std::uint8_t> data,
                                         surface& surf,
                                         const decode_options& options) {
    dib_image image;
    auto result = decode(data, image, options);
    if (!result) {
        return result;
    }
    return write_surface(image, surf);
}

decode_result write_surface(const dib_image& image, surface& surf) {
    if (image.width <= 0 || image.height <= 0) {
        return decode_result::failure(decode_error::invalid_format, "Invalid image dimensions");
    }
    if (image.pixels.size() < image.stride() * static_cast<std::size_t>(image.height)) {
        return decode_result::failure(decode_error::truncated_data, "Pixel buffer smaller than image");
    }

    const auto width = static_cast<std::size_t>(image.width);

    switch (image.bits_per_pixel) {
        case 4:
        case 8: {
            if (!surf.set_size(image.width, image.height, pixel_format::indexed8)) {
                return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
            }
            if (image.palette_entries() > 0) {
                write_indexed_palette(surf, image);
            } else {
                write_grayscale_palette(surf, image.bits_per_pixel);
            }

            std::vector<std::uint8_t> row(width);
            for (int y = 0; y < image.height; ++y) {
                const std::uint8_t* src = image.scanline(y).data();
                for (std::size_t x = 0; x < width; ++x) {
                    row[x] = extract_pixel(src, static_cast<int>(x), image.bits_per_pixel);
                }
                surf.write_row(y, row);
            }
            break;
        }
        case 24: {
            if (!surf.set_size(image.width, image.height, pixel_format::rgb888)) {
                return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
            }

            std::vector<std::uint8_t> row(width * 3);
            for (int y = 0; y < image.height; ++y) {
                const std::uint8_t* src = image.scanline(y).data();
                for (std::size_t x = 0; x < width; ++x) {
                    row[x * 3 + 0] = src[x * 3 + 2];
                    row[x * 3 + 1] = src[x * 3 + 1];
                    row[x * 3 + 2] = src[x * 3 + 0];
                }
                surf.write_row(y, row);
            }
            break;
        }
        case 32: {
            if (!surf.set_size(image.width, image.height, pixel_format::rgba8888)) {
                return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
            }

            // BI_RGB leaves the fourth byte unused
            std::vector<std::uint8_t> row(width * 4);
            for (int y = 0; y < image.height; ++y) {
                const std::uint8_t* src = image.scanline(y).data();
                for (std::size_t x = 0; x < width; ++x) {
                    row[x * 4 + 0] = src[x * 4 + 2];
                    row[x * 4 + 1] = src[x * 4 + 1];
                    row[x * 4 + 2] = src[x * 4 + 0];
                    row[x * 4 + 3] = 255;
                }
                surf.write_row(y, row);
            }
            break;
        }
        default:
            return decode_result::failure(decode_error::unsupported_bit_depth,
                "Unsupported bits per pixel: " + std::to_string(image.bits_per_pixel));
    }

    return decode_result::success();
}

} // namespace jam_image
