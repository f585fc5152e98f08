#ifndef JAM_IMAGE_JAM_IMAGE_HPP_
#define JAM_IMAGE_JAM_IMAGE_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>
#include <jam_image/surface.hpp>
#include <jam_image/dib_image.hpp>
#include <jam_image/scratch_buffer.hpp>
#include <jam_image/chunk_stream.hpp>
#include <jam_image/scanline_assembler.hpp>
#include <jam_image/archive.hpp>
#include <jam_image/codecs/jam_bitmap.hpp>
#include <jam_image/codecs/bmp.hpp>
#include <jam_image/codecs/png.hpp>

namespace jam_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:              decode_error, decode_result, decode_options, chunk tracing types
//   - surface.hpp:            surface interface, memory_surface
//   - dib_image.hpp:          bottom-up, stride-padded bitmap produced by the decoder
//   - scratch_buffer.hpp:     fixed 1500-byte chunk window
//   - chunk_stream.hpp:       chunk reader and back-reference decompressor
//   - scanline_assembler.hpp: rows from chunks, bottom-up
//   - archive.hpp:            LJAM archive listing and extraction
//   - codecs/*.hpp:           JAM bitmap decoder, BMP writer, PNG encoder

} // namespace jam_image

#endif // JAM_IMAGE_JAM_IMAGE_HPP_
