#ifndef JAM_IMAGE_SCANLINE_ASSEMBLER_HPP_
#define JAM_IMAGE_SCANLINE_ASSEMBLER_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>
#include <jam_image/chunk_stream.hpp>
#include <jam_image/dib_image.hpp>
#include <jam_image/scratch_buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace jam_image {

// ============================================================================
// Scanline Assembler
// ============================================================================

/**
 * Drains the scratch buffer into scanlines, reading further chunks from the
 * stream whenever the buffer runs dry. Chunk boundaries need not line up
 * with rows: one row may span several chunks and one chunk several rows.
 *
 * The assembler keeps references to its stream, scratch buffer and options;
 * all three must outlive it.
 */
class JAM_IMAGE_EXPORT scanline_assembler {
public:
    scanline_assembler(byte_stream& stream, scratch_buffer& scratch, const decode_options& options) noexcept
        : stream_(stream), scratch_(scratch), options_(options) {}

    /**
     * Fill destination completely with the next decoded bytes.
     * @param destination One packed scanline (or any byte run)
     * @return Failure from the chunk reader if the stream runs out or is malformed
     */
    [[nodiscard]] decode_result fill(std::span<std::uint8_t> destination);

    /**
     * Decode every row of image into image.pixels.
     * Rows arrive top-down and are stored bottom-up, each padded with zeros
     * to image.stride(). Width, height and bits_per_pixel must already be set.
     * No chunk is read after the last row, so trailing data is left unread.
     */
    [[nodiscard]] decode_result assemble(dib_image& image);

    [[nodiscard]] std::size_t chunks_read() const noexcept { return chunks_read_; }

private:
    byte_stream& stream_;
    scratch_buffer& scratch_;
    const decode_options& options_;
    std::size_t chunks_read_ = 0;
};

} // namespace jam_image

#endif // JAM_IMAGE_SCANLINE_ASSEMBLER_HPP_
