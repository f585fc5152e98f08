#include <jam_image/jam_image.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <image_file> [output_file]\n";
    std::cerr << "Converts a compressed JAM bitmap to a standard BMP.\n";
    std::cerr << "Standard BMP input is copied unchanged.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -v, --verbose  Trace every chunk and decoded token\n";
    std::cerr << "  -p, --png      Also write a PNG next to the output\n";
    std::cerr << "  -s, --strict   Reject chunks whose expanded size differs from the declared size\n";
    std::cerr << "  -h, --help     Show this help\n";
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

bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file.good();
}

void install_trace(jam_image::decode_options& options) {
    options.on_chunk = [](const jam_image::chunk_descriptor& desc) {
        std::cerr << "chunk: " << desc.decompressed_size << " bytes from " << desc.compressed_size
                  << (desc.is_raw() ? " (raw)" : "") << "\n";
    };
    options.on_token = [](const jam_image::chunk_token& token) {
        switch (token.kind) {
            case jam_image::token_kind::literal:
                std::cerr << "  @" << token.output_position << " literal "
                          << static_cast<int>(token.value) << "\n";
                break;
            case jam_image::token_kind::back_reference:
                std::cerr << "  @" << token.output_position << " copy " << token.length
                          << " from -" << token.offset << "\n";
                break;
            case jam_image::token_kind::end_of_chunk:
                std::cerr << "  @" << token.output_position << " end of chunk\n";
                break;
        }
    };
}

} // namespace

int main(int argc, char* argv[]) {
    jam_image::decode_options options;
    bool verbose = false;
    bool write_png = false;
    std::vector<std::filesystem::path> paths;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--png") == 0) {
            write_png = true;
        } else if (std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--strict") == 0) {
            options.strict_chunk_sizes = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            paths.emplace_back(argv[i]);
        }
    }

    if (paths.empty() || paths.size() > 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path& input_path = paths[0];

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    // Use second argument as output path, or <stem>_dumped.bmp beside the input
    std::filesystem::path output_path;
    if (paths.size() == 2) {
        output_path = paths[1];
    } else {
        output_path = input_path;
        output_path.replace_filename(input_path.stem().string() + "_dumped.bmp");
    }

    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    if (jam_image::bmp_codec::sniff(data)) {
        // The header is only read for the message; the file is copied either way
        jam_image::bmp_info info;
        auto result = jam_image::bmp_codec::inspect(data, info);
        if (result) {
            std::cout << "Standard BMP detected (" << info.width << "x" << info.height << ", "
                      << info.bits_per_pixel << " bpp). Copying to " << output_path << "\n";
        } else {
            std::cerr << "Warning: Unreadable BMP header: " << result.message << "\n";
            std::cout << "Standard BMP signature detected. Copying to " << output_path << "\n";
        }
        if (!write_file(output_path, data)) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            return 1;
        }
        return 0;
    }

    if (verbose) {
        install_trace(options);
    }

    jam_image::dib_image image;
    auto result = jam_image::jam_bitmap_decoder::decode(data, image, options);
    if (!result) {
        std::cerr << "Error: Failed to decode: " << result.message
                  << " (" << jam_image::to_string(result.error) << ")\n";
        return 1;
    }

    std::cout << "Decoded: " << image.width << "x" << image.height << ", "
              << image.bits_per_pixel << " bpp\n";

    if (!jam_image::save_bmp(image, output_path)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }
    std::cout << "Saved: " << output_path << "\n";

    if (write_png) {
        jam_image::png_surface surface;
        result = jam_image::write_surface(image, surface);
        if (!result) {
            std::cerr << "Error: Failed to convert for PNG: " << result.message << "\n";
            return 1;
        }

        auto png_path = output_path;
        png_path.replace_extension(".png");
        if (!surface.save(png_path)) {
            std::cerr << "Error: Failed to save: " << png_path << "\n";
            return 1;
        }
        std::cout << "Saved: " << png_path << "\n";
    }

    return 0;
}
