#ifndef JAM_IMAGE_CODECS_BMP_HPP_
#define JAM_IMAGE_CODECS_BMP_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>
#include <jam_image/dib_image.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace jam_image {

// ============================================================================
// Windows BMP
// ============================================================================

// Header fields of an existing BMP file
struct bmp_info {
    int width = 0;
    int height = 0;
    bool top_down = false;
    int bits_per_pixel = 0;
    std::uint32_t compression = 0;
    std::uint32_t header_size = 0;
    std::uint32_t data_offset = 0;
};

class JAM_IMAGE_EXPORT bmp_codec {
public:
    static constexpr std::size_t FILE_HEADER_SIZE = 14;
    static constexpr std::size_t INFO_HEADER_SIZE = 40;
    static constexpr std::uint32_t BI_RGB = 0;

    /**
     * Check for the "BM" signature of a standard bitmap.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Read the file and info headers of a standard bitmap.
     * @return invalid_format if the headers cannot be parsed
     */
    [[nodiscard]] static decode_result inspect(std::span<const std::uint8_t> data, bmp_info& info);

    /**
     * Number of palette entries written for an image: 0 without a palette,
     * otherwise 16 for 4 bpp and 256 for 8 bpp.
     */
    [[nodiscard]] static std::size_t palette_slots(const dib_image& image) noexcept;

    /**
     * Serialize a DIB as an uncompressed (BI_RGB) bitmap with a
     * BITMAPINFOHEADER. Pixel rows are copied as stored, bottom-up.
     * @return BMP file contents, or empty vector if the image is inconsistent
     */
    [[nodiscard]] static std::vector<std::uint8_t> encode(const dib_image& image);
};

/**
 * Save a DIB to a BMP file.
 * @return true on success
 */
[[nodiscard]] JAM_IMAGE_EXPORT bool save_bmp(const dib_image& image, const std::filesystem::path& path);

} // namespace jam_image

#endif // JAM_IMAGE_CODECS_BMP_HPP_
