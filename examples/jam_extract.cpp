#include <jam_image/jam_image.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <archive.jam> [output_dir]\n";
    std::cerr << "Extracts the files of a JAM (LJAM) archive.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list    List entries instead of extracting\n";
    std::cerr << "  -h, --help    Show this help\n";
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

void print_entry(const jam_image::archive_entry& entry) {
    if (entry.is_directory) {
        std::cout << "  " << entry.path << "/\n";
    } else {
        std::cout << "  " << entry.path << " (" << entry.size << " bytes)\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    bool list_only = false;
    std::vector<std::filesystem::path> paths;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-l") == 0 || std::strcmp(argv[i], "--list") == 0) {
            list_only = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            paths.emplace_back(argv[i]);
        }
    }

    if (paths.empty() || paths.size() > 2 || (!list_only && paths.size() != 2)) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path& input_path = paths[0];

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    std::vector<jam_image::archive_entry> entries;

    if (list_only) {
        auto result = jam_image::jam_archive::list(data, entries);
        if (!result) {
            std::cerr << "Error: " << result.message << "\n";
            return 1;
        }
        for (const auto& entry : entries) {
            print_entry(entry);
        }
        return 0;
    }

    const std::filesystem::path& output_dir = paths[1];
    auto result = jam_image::jam_archive::extract(data, output_dir, &entries);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    std::cout << "Extracted " << entries.size() << " entries from " << input_path
              << " to " << output_dir << "\n";

    return 0;
}
