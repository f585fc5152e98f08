#ifndef JAM_IMAGE_DIB_IMAGE_HPP_
#define JAM_IMAGE_DIB_IMAGE_HPP_

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace jam_image {

// Tightly packed bytes per row
[[nodiscard]] constexpr std::size_t packed_row_bytes(int width, int bits_per_pixel) noexcept {
    return (static_cast<std::size_t>(width) * static_cast<std::size_t>(bits_per_pixel) + 7) / 8;
}

// Row stride calculation (4-byte aligned, as stored in a DIB)
[[nodiscard]] constexpr std::size_t dib_stride(int width, int bits_per_pixel) noexcept {
    return ((static_cast<std::size_t>(width) * static_cast<std::size_t>(bits_per_pixel) + 31) / 32) * 4;
}

// ============================================================================
// Device-Independent Bitmap
// ============================================================================

/**
 * Uncompressed bitmap in standard DIB layout: rows bottom-up, each row
 * zero-padded to a 4-byte stride. This is the form the BMP writer emits
 * byte for byte.
 */
struct dib_image {
    int width = 0;
    int height = 0;
    int bits_per_pixel = 0;

    // Source palette as B,G,R,0 quads; empty for true-color or palette-less images
    std::vector<std::uint8_t> palette;

    // stride() * height bytes, last image row first
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] std::size_t stride() const noexcept { return dib_stride(width, bits_per_pixel); }
    [[nodiscard]] std::size_t row_bytes() const noexcept { return packed_row_bytes(width, bits_per_pixel); }
    [[nodiscard]] std::size_t palette_entries() const noexcept { return palette.size() / 4; }

    // Image row y counted from the top, stride() bytes including padding
    [[nodiscard]] std::span<const std::uint8_t> scanline(int y) const noexcept {
        if (y < 0 || y >= height || pixels.size() < stride() * static_cast<std::size_t>(height)) {
            return {};
        }
        return std::span<const std::uint8_t>(pixels).subspan(
            static_cast<std::size_t>(height - 1 - y) * stride(), stride());
    }
};

} // namespace jam_image

#endif // JAM_IMAGE_DIB_IMAGE_HPP_
