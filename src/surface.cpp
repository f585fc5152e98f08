#include <jam_image/surface.hpp>

#include <algorithm>
#include <cstring>
#include <limits>

namespace jam_image {

bool memory_surface::set_size(int width, int height, pixel_format format) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t bpp = bytes_per_pixel(format);

    if (w > std::numeric_limits<std::size_t>::max() / bpp) {
        return false;
    }
    const std::size_t pitch = w * bpp;

    if (pitch > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = pitch;

    try {
        pixels_.assign(pitch * h, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    palette_.clear();

    return true;
}

void memory_surface::write_row(int y, std::span<const std::uint8_t> pixels) {
    if (y < 0 || y >= height_ || pixels.empty()) {
        return;
    }

    const std::size_t offset = static_cast<std::size_t>(y) * pitch_;
    const std::size_t bytes_to_copy = std::min(pixels.size(), pitch_);
    std::memcpy(pixels_.data() + offset, pixels.data(), bytes_to_copy);
}

std::span<const std::uint8_t> memory_surface::row(int y) const noexcept {
    if (y < 0 || y >= height_) {
        return {};
    }
    return std::span<const std::uint8_t>(pixels_).subspan(static_cast<std::size_t>(y) * pitch_, pitch_);
}

void memory_surface::set_palette_size(int count) {
    if (count <= 0 || count > 256) {
        return;
    }
    palette_.assign(static_cast<std::size_t>(count) * 3, 0);
}

void memory_surface::write_palette(int start, std::span<const std::uint8_t> colors) {
    if (start < 0 || colors.empty()) {
        return;
    }

    const std::size_t start_offset = static_cast<std::size_t>(start) * 3;
    if (start_offset >= palette_.size()) {
        return;
    }

    const std::size_t bytes_to_copy = std::min(colors.size(), palette_.size() - start_offset);
    std::memcpy(palette_.data() + start_offset, colors.data(), bytes_to_copy);
}

} // namespace jam_image
