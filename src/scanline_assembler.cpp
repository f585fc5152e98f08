#include <jam_image/scanline_assembler.hpp>

#include <new>
#include <string>

namespace jam_image {

namespace {

// A 4-byte descriptor plus a 1-byte compressed payload can declare a full
// scratch buffer, so no stream byte yields more than this much output
constexpr std::size_t MAX_EXPANSION = scratch_buffer::capacity / 5;

} // namespace

decode_result scanline_assembler::fill(std::span<std::uint8_t> destination) {
    std::size_t filled = 0;

    while (filled < destination.size()) {
        if (scratch_.exhausted()) {
            auto result = read_chunk(stream_, scratch_, options_);
            if (!result) {
                return result;
            }
            ++chunks_read_;
        }
        filled += scratch_.consume(destination.subspan(filled));
    }

    return decode_result::success();
}

decode_result scanline_assembler::assemble(dib_image& image) {
    if (image.width < 0 || image.height < 0) {
        return decode_result::failure(decode_error::invalid_format, "Invalid image dimensions");
    }

    const std::size_t stride = image.stride();
    const std::size_t row_bytes = image.row_bytes();
    const auto height = static_cast<std::size_t>(image.height);

    const std::size_t needed = row_bytes * height;
    if (needed / MAX_EXPANSION > stream_.remaining()) {
        return decode_result::failure(decode_error::truncated_data,
            std::to_string(stream_.remaining()) + " bytes of chunk data cannot hold a " +
            std::to_string(image.width) + "x" + std::to_string(image.height) + " image");
    }

    try {
        image.pixels.assign(stride * height, 0);
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate pixel buffer");
    }

    for (std::size_t y = 0; y < height; ++y) {
        const std::size_t offset = (height - 1 - y) * stride;
        auto result = fill(std::span<std::uint8_t>(image.pixels).subspan(offset, row_bytes));
        if (!result) {
            return decode_result::failure(result.error,
                "Row " + std::to_string(y) + ": " + result.message);
        }
    }

    return decode_result::success();
}

} // namespace jam_image
