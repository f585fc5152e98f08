#include <jam_image/chunk_stream.hpp>

#include <algorithm>
#include <string>

namespace jam_image {

namespace {

// Back-reference lengths: 18 - lo for lo in 1..15, else 18 + extra byte
constexpr std::size_t LENGTH_BIAS = 18;

void trace_literal(const decode_options& options, std::size_t position, std::uint8_t value) {
    if (options.on_token) {
        options.on_token({token_kind::literal, position, value, 0, 0});
    }
}

decode_result overflow(std::size_t needed) {
    return decode_result::failure(decode_error::buffer_overflow,
        "Chunk expands to " + std::to_string(needed) + " bytes, scratch buffer holds " +
        std::to_string(scratch_buffer::capacity));
}

} // namespace

decode_result read_chunk_descriptor(byte_stream& stream, chunk_descriptor& desc) {
    if (stream.remaining() < 4) {
        return decode_result::failure(decode_error::truncated_data,
            "Chunk descriptor truncated at offset " + std::to_string(stream.position()));
    }

    chunk_descriptor result;
    if (!stream.read_le16(result.decompressed_size) || !stream.read_le16(result.compressed_size)) {
        return decode_result::failure(decode_error::internal_error, "Chunk descriptor read failed");
    }

    desc = result;
    return decode_result::success();
}

decode_result decompress_chunk(std::span<const std::uint8_t> payload,
                               scratch_buffer& scratch,
                               std::size_t& produced,
                               const decode_options& options) {
    produced = 0;
    if (payload.empty()) {
        return decode_result::failure(decode_error::truncated_data, "Compressed chunk has no payload");
    }

    const auto out = scratch.storage();
    std::size_t in = 0;
    std::size_t cursor = 0;

    trace_literal(options, cursor, payload[in]);
    out[cursor++] = payload[in++];

    while (in < payload.size()) {
        std::uint8_t command = payload[in++];

        for (int bit = 0; bit < 8; ++bit) {
            // Bits left over after the last unit of the payload are padding
            if (in >= payload.size()) {
                break;
            }

            const bool is_reference = (command & 0x80) != 0;
            command = static_cast<std::uint8_t>(command << 1);

            if (!is_reference) {
                if (cursor >= scratch_buffer::capacity) {
                    return overflow(cursor + 1);
                }
                trace_literal(options, cursor, payload[in]);
                out[cursor++] = payload[in++];
                continue;
            }

            // +--------+--------+--------+
            // | hi  lo |   b2   |  (b3)  |
            // +--------+--------+--------+
            // offset = hi:b2 (12 bits), length from lo or b3
            if (payload.size() - in < 2) {
                return decode_result::failure(decode_error::truncated_data,
                    "Back-reference cut off at payload offset " + std::to_string(in));
            }
            const std::uint8_t b1 = payload[in++];
            const std::uint8_t b2 = payload[in++];
            const std::size_t offset = (static_cast<std::size_t>(b1 & 0xF0) << 4) | b2;

            if (offset == 0) {
                if (options.on_token) {
                    options.on_token({token_kind::end_of_chunk, cursor, 0, 0, 0});
                }
                produced = cursor;
                scratch.load(cursor);
                return decode_result::success();
            }

            if (offset > cursor) {
                return decode_result::failure(decode_error::invalid_offset,
                    "Back-reference offset " + std::to_string(offset) +
                    " exceeds decoded length " + std::to_string(cursor));
            }

            std::size_t length = 0;
            const std::uint8_t nibble = b1 & 0x0F;
            if (nibble != 0) {
                length = LENGTH_BIAS - nibble;
            } else {
                if (in >= payload.size()) {
                    return decode_result::failure(decode_error::truncated_data,
                        "Back-reference length byte missing at payload offset " + std::to_string(in));
                }
                length = payload[in++] + LENGTH_BIAS;
            }

            if (cursor + length > scratch_buffer::capacity) {
                return overflow(cursor + length);
            }

            if (options.on_token) {
                options.on_token({token_kind::back_reference, cursor, 0, offset, length});
            }

            // Source and destination may overlap; copy one byte at a time
            for (std::size_t i = 0; i < length; ++i) {
                out[cursor] = out[cursor - offset];
                ++cursor;
            }
        }
    }

    produced = cursor;
    scratch.load(cursor);
    return decode_result::success();
}

decode_result read_chunk(byte_stream& stream, scratch_buffer& scratch, const decode_options& options) {
    chunk_descriptor desc;
    auto result = read_chunk_descriptor(stream, desc);
    if (!result) {
        return result;
    }

    if (options.on_chunk) {
        options.on_chunk(desc);
    }

    if (desc.decompressed_size > scratch_buffer::capacity) {
        return overflow(desc.decompressed_size);
    }

    std::span<const std::uint8_t> payload;

    if (desc.is_raw()) {
        if (!stream.take(desc.decompressed_size, payload)) {
            return decode_result::failure(decode_error::truncated_data,
                "Raw chunk of " + std::to_string(desc.decompressed_size) + " bytes extends past end of data");
        }
        std::copy(payload.begin(), payload.end(), scratch.storage().begin());
        scratch.load(desc.decompressed_size);
        return decode_result::success();
    }

    if (!stream.take(desc.compressed_size, payload)) {
        return decode_result::failure(decode_error::truncated_data,
            "Compressed chunk of " + std::to_string(desc.compressed_size) + " bytes extends past end of data");
    }

    std::size_t produced = 0;
    result = decompress_chunk(payload, scratch, produced, options);
    if (!result) {
        return result;
    }

    if (produced != desc.decompressed_size) {
        if (options.strict_chunk_sizes) {
            return decode_result::failure(decode_error::invalid_format,
                "Chunk expanded to " + std::to_string(produced) + " bytes, descriptor declares " +
                std::to_string(desc.decompressed_size));
        }
        // Never hand out bytes left behind by an earlier chunk
        if (produced < desc.decompressed_size) {
            const auto storage = scratch.storage();
            std::fill(storage.begin() + static_cast<std::ptrdiff_t>(produced),
                      storage.begin() + desc.decompressed_size, std::uint8_t{0});
        }
    }

    scratch.load(desc.decompressed_size);
    return decode_result::success();
}

} // namespace jam_image
