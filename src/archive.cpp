#include <jam_image/archive.hpp>
#include "codecs/byte_io.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <system_error>

namespace jam_image {

namespace {

constexpr std::uint8_t JAM_SIGNATURE[] = {'L', 'J', 'A', 'M'};
constexpr std::size_t ROOT_FOLDER_OFFSET = 4;
constexpr std::size_t FILE_RECORD_SIZE = jam_archive::NAME_SIZE + 8;
constexpr std::size_t FOLDER_RECORD_SIZE = jam_archive::NAME_SIZE + 4;

// Name up to the first NUL; rejects anything that could escape the destination
bool parse_name(const std::uint8_t* p, std::string& name) {
    const auto* end = std::find(p, p + jam_archive::NAME_SIZE, std::uint8_t{0});
    name.assign(reinterpret_cast<const char*>(p), static_cast<std::size_t>(end - p));

    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\:") == std::string::npos;
}

class tree_walker {
public:
    tree_walker(std::span<const std::uint8_t> data, std::vector<archive_entry>& entries)
        : data_(data), entries_(entries) {}

    decode_result walk(std::size_t offset, const std::string& prefix, std::size_t depth = 0) {
        if (depth > jam_archive::MAX_FOLDER_DEPTH) {
            return decode_result::failure(decode_error::invalid_format,
                "Folders nested deeper than " + std::to_string(jam_archive::MAX_FOLDER_DEPTH) +
                " levels at offset " + std::to_string(offset));
        }
        if (!visited_.insert(offset).second) {
            return decode_result::failure(decode_error::invalid_format,
                "Folder record at " + std::to_string(offset) + " is referenced twice");
        }

        std::uint32_t file_count = 0;
        if (!read_count(offset, file_count)) {
            return truncated(offset);
        }
        offset += 4;

        if (file_count > (data_.size() - offset) / FILE_RECORD_SIZE) {
            return truncated(offset);
        }
        for (std::uint32_t i = 0; i < file_count; ++i) {
            const std::uint8_t* rec = data_.data() + offset;
            archive_entry entry;
            if (!parse_name(rec, entry.path)) {
                return bad_name(offset);
            }
            entry.path = prefix + entry.path;
            entry.offset = read_le32(rec + jam_archive::NAME_SIZE);
            entry.size = read_le32(rec + jam_archive::NAME_SIZE + 4);

            if (entry.offset > data_.size() || entry.size > data_.size() - entry.offset) {
                return decode_result::failure(decode_error::truncated_data,
                    "Contents of " + entry.path + " extend past end of archive");
            }
            entries_.push_back(std::move(entry));
            offset += FILE_RECORD_SIZE;
        }

        std::uint32_t folder_count = 0;
        if (!read_count(offset, folder_count)) {
            return truncated(offset);
        }
        offset += 4;

        if (folder_count > (data_.size() - offset) / FOLDER_RECORD_SIZE) {
            return truncated(offset);
        }
        for (std::uint32_t i = 0; i < folder_count; ++i) {
            const std::uint8_t* rec = data_.data() + offset;
            archive_entry entry;
            if (!parse_name(rec, entry.path)) {
                return bad_name(offset);
            }
            entry.path = prefix + entry.path;
            entry.is_directory = true;
            entry.offset = read_le32(rec + jam_archive::NAME_SIZE);

            const std::string child_prefix = entry.path + "/";
            const std::size_t child_offset = entry.offset;
            entries_.push_back(std::move(entry));

            auto result = walk(child_offset, child_prefix, depth + 1);
            if (!result) {
                return result;
            }
            offset += FOLDER_RECORD_SIZE;
        }

        return decode_result::success();
    }

private:
    bool read_count(std::size_t offset, std::uint32_t& count) const {
        if (offset > data_.size() || data_.size() - offset < 4) {
            return false;
        }
        count = read_le32(data_.data() + offset);
        return true;
    }

    static decode_result truncated(std::size_t offset) {
        return decode_result::failure(decode_error::truncated_data,
            "Folder record truncated at offset " + std::to_string(offset));
    }

    static decode_result bad_name(std::size_t offset) {
        return decode_result::failure(decode_error::invalid_format,
            "Invalid entry name at offset " + std::to_string(offset));
    }

    std::span<const std::uint8_t> data_;
    std::vector<archive_entry>& entries_;
    std::set<std::size_t> visited_;
};

} // namespace

bool jam_archive::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < sizeof(JAM_SIGNATURE)) {
        return false;
    }
    return std::equal(std::begin(JAM_SIGNATURE), std::end(JAM_SIGNATURE), data.begin());
}

decode_result jam_archive::list(std::span<const std::uint8_t> data,
                                std::vector<archive_entry>& entries) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::invalid_format,
            "Not a JAM archive: missing LJAM signature");
    }

    std::vector<archive_entry> result;
    tree_walker walker(data, result);
    auto walked = walker.walk(ROOT_FOLDER_OFFSET, {});
    if (!walked) {
        return walked;
    }

    entries = std::move(result);
    return decode_result::success();
}

std::span<const std::uint8_t> jam_archive::contents(std::span<const std::uint8_t> data,
                                                    const archive_entry& entry) noexcept {
    if (entry.is_directory || entry.offset > data.size() || entry.size > data.size() - entry.offset) {
        return {};
    }
    return data.subspan(entry.offset, entry.size);
}

decode_result jam_archive::extract(std::span<const std::uint8_t> data,
                                   const std::filesystem::path& destination,
                                   std::vector<archive_entry>* extracted) {
    std::vector<archive_entry> entries;
    auto result = list(data, entries);
    if (!result) {
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return decode_result::failure(decode_error::io_error,
            "Failed to create " + destination.string() + ": " + ec.message());
    }

    for (const auto& entry : entries) {
        const auto target = destination / std::filesystem::path(entry.path);

        if (entry.is_directory) {
            std::filesystem::create_directories(target, ec);
            if (ec) {
                return decode_result::failure(decode_error::io_error,
                    "Failed to create " + target.string() + ": " + ec.message());
            }
            continue;
        }

        const auto bytes = contents(data, entry);
        std::ofstream file(target, std::ios::binary);
        if (!file) {
            return decode_result::failure(decode_error::io_error, "Failed to open " + target.string());
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file.good()) {
            return decode_result::failure(decode_error::io_error, "Failed to write " + target.string());
        }
    }

    if (extracted) {
        *extracted = std::move(entries);
    }
    return decode_result::success();
}

} // namespace jam_image
