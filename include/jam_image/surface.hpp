#ifndef JAM_IMAGE_SURFACE_HPP_
#define JAM_IMAGE_SURFACE_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace jam_image {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for top-down image surfaces.
 * The bitmap decoder converts its bottom-up pixel buffer into surface rows,
 * so callers can display or re-encode an image without knowing DIB layout.
 */
class JAM_IMAGE_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions and pixel format.
     * Called before any pixel writes.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Write one complete row of pixel data.
     * @param y Row number, 0 is the top row
     * @param pixels Row bytes in the surface's pixel format
     */
    virtual void write_row(int y, std::span<const std::uint8_t> pixels) = 0;

    /**
     * Set the palette size (for indexed formats).
     * @param count Number of palette entries (max 256)
     */
    virtual void set_palette_size(int count) { (void)count; }

    /**
     * Write palette entries.
     * @param start Starting palette index
     * @param colors RGB triplets (3 bytes per color)
     */
    virtual void write_palette(int start, std::span<const std::uint8_t> colors) {
        (void)start;
        (void)colors;
    }
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

class JAM_IMAGE_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    bool set_size(int width, int height, pixel_format format) override;
    void write_row(int y, std::span<const std::uint8_t> pixels) override;
    void set_palette_size(int count) override;
    void write_palette(int start, std::span<const std::uint8_t> colors) override;

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<const std::uint8_t> palette() const noexcept { return palette_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }

    // Row y of the surface, pitch() bytes long
    [[nodiscard]] std::span<const std::uint8_t> row(int y) const noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    std::vector<std::uint8_t> palette_;  // RGB triplets
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgba8888;
};

} // namespace jam_image

#endif // JAM_IMAGE_SURFACE_HPP_
