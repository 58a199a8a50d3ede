#include <rwtxd/rwtxd.hpp>

#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <txd_file>\n";
    std::cerr << "Lists the textures of a RenderWare texture dictionary.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -d, --decode   Decode every texture and report failures\n";
    std::cerr << "  -v, --verbose  Trace the section walk\n";
    std::cerr << "  -h, --help     Show this help\n";
}

void print_statistics(const rwtxd::txd_archive& archive) {
    const auto stats = archive.get_statistics();

    std::cout << "RenderWare: " << stats.renderware_version.value_or("unknown") << "\n";
    std::cout << "Textures:   " << stats.total_textures << "\n";
    std::cout << "Pixel data: " << stats.total_size_bytes << " bytes\n";
    std::cout << "Average:    " << std::fixed << std::setprecision(1)
              << stats.average_width << "x" << stats.average_height << "\n";

    for (const auto& [format, count] : stats.format_counts) {
        std::cout << "  " << std::left << std::setw(16) << format << count << "\n";
    }
}

void print_textures(const rwtxd::txd_archive& archive) {
    std::cout << "\n";
    std::cout << std::left << std::setw(33) << "Name"
              << std::setw(12) << "Size"
              << std::setw(6) << "Mips"
              << std::setw(10) << "Encoding"
              << "Platform\n";

    for (const auto& tex : archive.textures()) {
        const auto size = std::to_string(tex.width) + "x" + std::to_string(tex.height);
        std::cout << std::left << std::setw(33) << tex.name
                  << std::setw(12) << size
                  << std::setw(6) << static_cast<int>(tex.mipmap_count)
                  << std::setw(10) << rwtxd::to_string(tex.encoding)
                  << rwtxd::platform_name(tex.platform_id) << "\n";
    }
}

// Returns the number of textures that failed to decode
int decode_all(const rwtxd::txd_archive& archive) {
    int failures = 0;
    for (const auto& tex : archive.textures()) {
        std::vector<std::uint8_t> rgba;
        auto result = tex.to_rgba(archive, 0, rgba);
        if (!result) {
            std::cerr << "Error: " << tex.name << ": " << result.message << "\n";
            ++failures;
        }
    }
    return failures;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    bool decode = false;
    rwtxd::load_options options;
    const char* input = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-d") == 0 || std::strcmp(argv[i], "--decode") == 0) {
            decode = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else {
            input = argv[i];
        }
    }

    if (!input) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(input);

    rwtxd::txd_archive archive;
    auto result = rwtxd::txd_archive::load_from_path(input_path, archive, options);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    print_statistics(archive);
    print_textures(archive);

    if (decode) {
        const int failures = decode_all(archive);
        std::cout << "\nDecoded " << archive.total_textures() - static_cast<std::size_t>(failures)
                  << " of " << archive.total_textures() << " textures\n";
        if (failures > 0) {
            return 1;
        }
    }

    return 0;
}
