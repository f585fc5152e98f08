#ifndef JAM_IMAGE_ARCHIVE_HPP_
#define JAM_IMAGE_ARCHIVE_HPP_

#include <jam_image/jam_image_export.h>
#include <jam_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace jam_image {

// ============================================================================
// JAM Archive
// ============================================================================
//
// Layout (all integers little-endian):
//   "LJAM"
//   folder record at offset 4:
//     u32 file count,   then per file:   char[12] name, u32 offset, u32 size
//     u32 folder count, then per folder: char[12] name, u32 offset of its record
//
// Names are NUL-padded. Folder records may appear anywhere in the file.

struct archive_entry {
    std::string path;           // '/'-separated, relative to the archive root
    bool is_directory = false;
    std::uint32_t offset = 0;   // file contents, or the folder record
    std::uint32_t size = 0;     // 0 for directories
};

class JAM_IMAGE_EXPORT jam_archive {
public:
    static constexpr std::size_t NAME_SIZE = 12;
    static constexpr std::size_t MAX_FOLDER_DEPTH = 32;

    /**
     * Check for the "LJAM" signature.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Walk the folder tree, depth first, files of a folder before its subfolders.
     * @return invalid_format for a bad signature, unsafe names, folder cycles
     *         or folders nested deeper than MAX_FOLDER_DEPTH;
     *         truncated_data for records or contents past the end of data
     */
    [[nodiscard]] static decode_result list(std::span<const std::uint8_t> data,
                                             std::vector<archive_entry>& entries);

    /**
     * Contents of a file entry, or an empty span if it lies outside data.
     */
    [[nodiscard]] static std::span<const std::uint8_t> contents(std::span<const std::uint8_t> data,
                                                                 const archive_entry& entry) noexcept;

    /**
     * Write every folder and file below destination, creating directories.
     * @param extracted Receives the listed entries when not null
     * @return list() failures, or io_error if the filesystem refuses a write
     */
    [[nodiscard]] static decode_result extract(std::span<const std::uint8_t> data,
                                                const std::filesystem::path& destination,
                                                std::vector<archive_entry>* extracted = nullptr);
};

} // namespace jam_image

#endif // JAM_IMAGE_ARCHIVE_HPP_
