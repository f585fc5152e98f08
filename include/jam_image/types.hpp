#ifndef JAM_IMAGE_TYPES_HPP_
#define JAM_IMAGE_TYPES_HPP_

#include <jam_image/jam_image_export.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace jam_image {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    indexed8,   // 8-bit indices, up to 256 colors
    rgb888,     // 24-bit, 8-bit RGB components, no alpha
    rgba8888    // 32-bit, 8-bit RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::indexed8: return 1;
        case pixel_format::rgb888:   return 3;
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_format,
    unsupported_bit_depth,
    dimensions_exceeded,
    truncated_data,
    invalid_offset,
    buffer_overflow,
    io_error,
    internal_error
};

[[nodiscard]] JAM_IMAGE_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Chunk Stream Events
// ============================================================================

// 4-byte descriptor preceding every chunk of pixel data
struct chunk_descriptor {
    std::uint16_t decompressed_size = 0;
    std::uint16_t compressed_size = 0;

    // A chunk that did not shrink is stored verbatim
    [[nodiscard]] constexpr bool is_raw() const noexcept {
        return decompressed_size <= compressed_size;
    }
};

enum class token_kind {
    literal,
    back_reference,
    end_of_chunk
};

/**
 * One decoded token of a compressed chunk.
 * output_position is the write cursor before the token was applied.
 * value is set for literals; offset and length for back-references.
 */
struct chunk_token {
    token_kind kind = token_kind::literal;
    std::size_t output_position = 0;
    std::uint8_t value = 0;
    std::size_t offset = 0;
    std::size_t length = 0;
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // Fail when a compressed chunk expands to a length other than the
    // decompressed size declared in its descriptor
    bool strict_chunk_sizes = false;

    // Optional tracing hooks, invoked synchronously during decode
    std::function<void(const chunk_descriptor&)> on_chunk;
    std::function<void(const chunk_token&)> on_token;
};

} // namespace jam_image

#endif // JAM_IMAGE_TYPES_HPP_
