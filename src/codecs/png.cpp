#include <jam_image/codecs/png.hpp>
#include <lodepng.h>

#include <fstream>

namespace jam_image {

namespace {

std::vector<std::uint8_t> to_rgba(const memory_surface& surf) {
    const auto pixel_count = static_cast<std::size_t>(surf.width()) *
                             static_cast<std::size_t>(surf.height());
    const auto* src = surf.pixels().data();

    switch (surf.format()) {
        case pixel_format::rgba8888:
            return {surf.pixels().begin(), surf.pixels().end()};

        case pixel_format::rgb888: {
            std::vector<std::uint8_t> rgba(pixel_count * 4);
            for (std::size_t i = 0; i < pixel_count; ++i) {
                rgba[i * 4 + 0] = src[i * 3 + 0];
                rgba[i * 4 + 1] = src[i * 3 + 1];
                rgba[i * 4 + 2] = src[i * 3 + 2];
                rgba[i * 4 + 3] = 255;
            }
            return rgba;
        }

        case pixel_format::indexed8: {
            std::vector<std::uint8_t> rgba(pixel_count * 4);
            const auto palette = surf.palette();
            for (std::size_t i = 0; i < pixel_count; ++i) {
                const std::size_t pal_offset = static_cast<std::size_t>(src[i]) * 3;
                if (pal_offset + 2 < palette.size()) {
                    rgba[i * 4 + 0] = palette[pal_offset + 0];
                    rgba[i * 4 + 1] = palette[pal_offset + 1];
                    rgba[i * 4 + 2] = palette[pal_offset + 2];
                }
                rgba[i * 4 + 3] = 255;
            }
            return rgba;
        }
    }

    return {};
}

} // namespace

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto rgba_pixels = to_rgba(surf);
    if (rgba_pixels.empty()) {
        return {};
    }

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, rgba_pixels,
                                     static_cast<unsigned>(surf.width()),
                                     static_cast<unsigned>(surf.height()));
    if (error) {
        return {};
    }

    return png_data;
}

bool save_png(const memory_surface& surf, const std::filesystem::path& path) {
    auto png_data = encode_png(surf);
    if (png_data.empty()) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(png_data.data()),
               static_cast<std::streamsize>(png_data.size()));

    return file.good();
}

std::vector<std::uint8_t> png_surface::encode() const {
    return encode_png(*this);
}

bool png_surface::save(const std::filesystem::path& path) const {
    return save_png(*this, path);
}

} // namespace jam_image
