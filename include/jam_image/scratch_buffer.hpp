#ifndef JAM_IMAGE_SCRATCH_BUFFER_HPP_
#define JAM_IMAGE_SCRATCH_BUFFER_HPP_

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace jam_image {

// ============================================================================
// Scratch Buffer
// ============================================================================

/**
 * Fixed-capacity working window holding the decompressed bytes of one chunk.
 *
 * The chunk reader fills storage() from index 0 and then calls load() with the
 * chunk's size; the scanline assembler drains it with consume(). The buffer is
 * never resized, so a chunk larger than capacity must be rejected up front.
 *
 * Invariant: 0 <= position() <= size() <= capacity.
 */
class scratch_buffer {
public:
    static constexpr std::size_t capacity = 1500;

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t available() const noexcept { return size_ - position_; }
    [[nodiscard]] bool exhausted() const noexcept { return position_ >= size_; }

    [[nodiscard]] std::span<std::uint8_t> storage() noexcept { return data_; }

    // Valid bytes of the current chunk, consumed or not
    [[nodiscard]] std::span<const std::uint8_t> contents() const noexcept {
        return std::span<const std::uint8_t>(data_).first(size_);
    }

    // Make the first size bytes of storage the current chunk and rewind
    void load(std::size_t size) noexcept {
        size_ = std::min(size, capacity);
        position_ = 0;
    }

    // Copy unconsumed bytes into dest; returns the number copied
    std::size_t consume(std::span<std::uint8_t> dest) noexcept {
        const std::size_t count = std::min(dest.size(), available());
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), count, dest.begin());
        position_ += count;
        return count;
    }

private:
    std::array<std::uint8_t, capacity> data_{};
    std::size_t position_ = 0;
    std::size_t size_ = 0;
};

} // namespace jam_image

#endif // JAM_IMAGE_SCRATCH_BUFFER_HPP_
