#ifndef JAM_IMAGE_CODECS_PNG_HPP_
#define JAM_IMAGE_CODECS_PNG_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>
#include <jam_image/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace jam_image {

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a memory surface to PNG format (always 8-bit RGBA).
 * Indexed pixels without a palette entry come out black.
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] JAM_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Save a memory surface to a PNG file.
 * @param surf Source surface
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] JAM_IMAGE_EXPORT bool save_png(const memory_surface& surf,
                                              const std::filesystem::path& path);

// ============================================================================
// PNG Surface
// ============================================================================

/**
 * Surface that can save its contents as PNG.
 */
class JAM_IMAGE_EXPORT png_surface : public memory_surface {
public:
    png_surface() = default;
    ~png_surface() override = default;

    png_surface(const png_surface&) = delete;
    png_surface& operator=(const png_surface&) = delete;
    png_surface(png_surface&&) noexcept = default;
    png_surface& operator=(png_surface&&) noexcept = default;

    [[nodiscard]] std::vector<std::uint8_t> encode() const;
    [[nodiscard]] bool save(const std::filesystem::path& path) const;
};

} // namespace jam_image

#endif // JAM_IMAGE_CODECS_PNG_HPP_
