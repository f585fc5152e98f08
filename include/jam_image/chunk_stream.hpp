#ifndef JAM_IMAGE_CHUNK_STREAM_HPP_
#define JAM_IMAGE_CHUNK_STREAM_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>
#include <jam_image/scratch_buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace jam_image {

// ============================================================================
// Byte Stream
// ============================================================================

/**
 * Read-once cursor over the chunk data that follows the bitmap header.
 * Reads either succeed completely or consume nothing.
 */
class byte_stream {
public:
    explicit byte_stream(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= data_.size(); }

    [[nodiscard]] bool take(std::size_t count, std::span<const std::uint8_t>& out) noexcept {
        if (count > remaining()) {
            return false;
        }
        out = data_.subspan(pos_, count);
        pos_ += count;
        return true;
    }

    [[nodiscard]] bool read_le16(std::uint16_t& value) noexcept {
        if (remaining() < 2) {
            return false;
        }
        value = static_cast<std::uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return true;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// ============================================================================
// Chunk Reader / Decompressor
// ============================================================================

/**
 * Read a 4-byte chunk descriptor (two little-endian u16 values: decompressed
 * size, then compressed size).
 * @return truncated_data if fewer than 4 bytes remain
 */
[[nodiscard]] JAM_IMAGE_EXPORT decode_result read_chunk_descriptor(byte_stream& stream,
                                                                    chunk_descriptor& desc);

/**
 * Expand one compressed chunk payload into the scratch buffer.
 *
 * The first payload byte is a literal. After it, each command byte governs
 * the next eight units MSB first: a clear bit copies one literal byte, a set
 * bit introduces a back-reference token (offset, length) that copies earlier
 * output byte by byte, so overlapping references repeat a pattern. A token
 * with offset zero ends the chunk.
 *
 * On success the scratch buffer holds the expanded bytes with its read
 * position rewound to 0, and produced receives the expanded length.
 *
 * @return invalid_offset for references before the start of the output,
 *         buffer_overflow when output would exceed scratch_buffer::capacity,
 *         truncated_data when the payload ends inside a token
 */
[[nodiscard]] JAM_IMAGE_EXPORT decode_result decompress_chunk(std::span<const std::uint8_t> payload,
                                                               scratch_buffer& scratch,
                                                               std::size_t& produced,
                                                               const decode_options& options = {});

/**
 * Read the next chunk from the stream into the scratch buffer.
 * Raw chunks are copied verbatim, compressed chunks are expanded. Either way
 * the buffer's size becomes the chunk's declared decompressed size and its
 * position is rewound to 0.
 */
[[nodiscard]] JAM_IMAGE_EXPORT decode_result read_chunk(byte_stream& stream,
                                                         scratch_buffer& scratch,
                                                         const decode_options& options = {});

} // namespace jam_image

#endif // JAM_IMAGE_CHUNK_STREAM_HPP_
