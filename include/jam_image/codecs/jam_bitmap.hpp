#ifndef JAM_IMAGE_CODECS_JAM_BITMAP_HPP_
#define JAM_IMAGE_CODECS_JAM_BITMAP_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>
#include <jam_image/surface.hpp>
#include <jam_image/dib_image.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace jam_image {

// ============================================================================
// JAM Compressed Bitmap
// ============================================================================
//
// Layout:
//   u8     flags        bits 2-5: bits per pixel, bit 7: no palette
//   u8     palette count minus one
//   u16le  width
//   u16le  height
//   [palette]           (count) x {blue, green, red}, only for 4/8 bpp
//   [chunks]            u16le decompressed size, u16le compressed size, data

struct jam_bitmap_header {
    std::uint8_t flags = 0;
    int bits_per_pixel = 0;
    int width = 0;
    int height = 0;
    int palette_size = 0;

    // B,G,R,0 quads, palette_size entries
    std::vector<std::uint8_t> palette;

    // Offset of the first chunk descriptor
    std::size_t data_offset = 0;
};

class JAM_IMAGE_EXPORT jam_bitmap_decoder {
public:
    static constexpr std::size_t HEADER_SIZE = 6;
    static constexpr std::uint8_t BITS_PER_PIXEL_MASK = 0x3C;
    static constexpr std::uint8_t FLAG_NO_PALETTE = 0x80;

    /**
     * Check if data appears to be a compressed JAM bitmap.
     * The format has no magic number: this accepts anything that is not a
     * standard BMP and whose header names a supported pixel depth.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Parse the fixed header and palette.
     * @return unsupported_bit_depth for depths other than 4/8/24/32,
     *         truncated_data if the header or palette is cut short,
     *         dimensions_exceeded if width/height exceed the option limits
     */
    [[nodiscard]] static decode_result read_header(std::span<const std::uint8_t> data,
                                                    jam_bitmap_header& header,
                                                    const decode_options& options = {});

    /**
     * Decode to a bottom-up, stride-padded DIB ready for the BMP writer.
     * Any failure leaves image unspecified; discard it.
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               dib_image& image,
                                               const decode_options& options = {});

    /**
     * Decode to a top-down surface.
     * 4 and 8 bpp become indexed8 (grayscale palette when the file has none),
     * 24 bpp becomes rgb888 and 32 bpp becomes opaque rgba8888.
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

/**
 * Copy a decoded DIB into a surface, flipping rows to top-down order.
 */
[[nodiscard]] JAM_IMAGE_EXPORT decode_result write_surface(const dib_image& image, surface& surf);

} // namespace jam_image

#endif // JAM_IMAGE_CODECS_JAM_BITMAP_HPP_
