#include <vexel/vexel.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

enum class output_format {
    ppm,
    pam
};

struct cli_options {
    std::vector<std::filesystem::path> inputs;
    std::filesystem::path output_dir;
    output_format format = output_format::ppm;
    bool info_only = false;
    bool void_output = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file|directory>...\n";
    std::cerr << "Decodes images and writes them as PPM or PAM.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -i, --info              Print image information instead of writing output\n";
    std::cerr << "      --void              Decode only, write nothing\n";
    std::cerr << "  -f, --format ppm|pam    Output format (default: ppm)\n";
    std::cerr << "  -o, --output-dir DIR    Output directory (default: beside the input)\n";
    std::cerr << "  -q, --quiet             Only log errors\n";
    std::cerr << "  -v, --verbose           Log decoder progress\n";
    std::cerr << "  -l, --list              List available codecs\n";
    std::cerr << "  -h, --help              Show this help\n";
}

void list_codecs() {
    std::cout << "Available codecs:\n";
    const auto& registry = vexel::codec_registry::instance();
    for (std::size_t i = 0; i < registry.codec_count(); ++i) {
        const auto* c = registry.codec_at(i);
        std::cout << "  " << c->name() << " (";
        bool first = true;
        for (const auto& ext : c->extensions()) {
            if (!first) std::cout << ", ";
            std::cout << ext;
            first = false;
        }
        std::cout << ")\n";
    }
}

// ============================================================================
// Writers
// ============================================================================

const char* tuple_type(std::size_t channels) {
    switch (channels) {
        case 1: return "GRAYSCALE";
        case 2: return "GRAYSCALE_ALPHA";
        case 3: return "RGB";
        default: return "RGB_ALPHA";
    }
}

vexel::status write_ppm(const std::filesystem::path& path, const vexel::image& img) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return vexel::failure(vexel::decode_error::io_error, "cannot create " + path.string());
    }
    const auto rgb = img.as_rgb8();
    file << "P6\n" << img.width() << " " << img.height() << "\n255\n";
    file.write(reinterpret_cast<const char*>(rgb.data()), static_cast<std::streamsize>(rgb.size()));
    if (!file) {
        return vexel::failure(vexel::decode_error::io_error, "write failed: " + path.string());
    }
    return vexel::status::success();
}

// PAM keeps the decoded channel layout and sample depth
vexel::status write_pam(const std::filesystem::path& path, const vexel::image& img) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return vexel::failure(vexel::decode_error::io_error, "cannot create " + path.string());
    }
    const bool wide = vexel::is_16bit(img.format());
    file << "P7\nWIDTH " << img.width() << "\nHEIGHT " << img.height()
         << "\nDEPTH " << img.channels() << "\nMAXVAL " << (wide ? 65535 : 255)
         << "\nTUPLTYPE " << tuple_type(img.channels()) << "\nENDHDR\n";

    if (wide) {
        const auto samples = img.pixels16();
        std::vector<std::uint8_t> be(samples.size() * 2);
        for (std::size_t i = 0; i < samples.size(); ++i) {
            be[i * 2] = static_cast<std::uint8_t>(samples[i] >> 8);
            be[i * 2 + 1] = static_cast<std::uint8_t>(samples[i] & 0xFF);
        }
        file.write(reinterpret_cast<const char*>(be.data()), static_cast<std::streamsize>(be.size()));
    } else {
        const auto samples = img.pixels8();
        file.write(reinterpret_cast<const char*>(samples.data()), static_cast<std::streamsize>(samples.size()));
    }
    if (!file) {
        return vexel::failure(vexel::decode_error::io_error, "write failed: " + path.string());
    }
    return vexel::status::success();
}

vexel::result<std::filesystem::path> output_path_for(const std::filesystem::path& input,
                                                     const cli_options& opts) {
    const char* ext = opts.format == output_format::pam ? ".pam" : ".ppm";
    std::filesystem::path dir = opts.output_dir.empty() ? input.parent_path() : opts.output_dir;
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return vexel::failure(vexel::decode_error::io_error,
                "cannot create " + dir.string() + ": " + ec.message());
        }
    }
    auto name = input.stem();
    name += ext;
    return dir / name;
}

bool parse_args(int argc, char* argv[], cli_options& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "--info") == 0) {
            opts.info_only = true;
        } else if (std::strcmp(arg, "--void") == 0) {
            opts.void_output = true;
        } else if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            vexel::set_log_level(vexel::log_level::error);
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            vexel::set_log_level(vexel::log_level::debug);
        } else if (std::strcmp(arg, "-f") == 0 || std::strcmp(arg, "--format") == 0) {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                return false;
            }
            if (std::strcmp(argv[i], "ppm") == 0) {
                opts.format = output_format::ppm;
            } else if (std::strcmp(argv[i], "pam") == 0) {
                opts.format = output_format::pam;
            } else {
                std::cerr << "Error: unknown output format: " << argv[i] << "\n";
                return false;
            }
        } else if (std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output-dir") == 0) {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                return false;
            }
            opts.output_dir = argv[i];
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return false;
        } else {
            opts.inputs.emplace_back(arg);
        }
    }
    return !opts.inputs.empty();
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    if (std::strcmp(argv[1], "-l") == 0 || std::strcmp(argv[1], "--list") == 0) {
        list_codecs();
        return 0;
    }

    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    vexel::set_log_level(vexel::log_level::info);

    cli_options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    auto on_decoded = [&opts](const std::filesystem::path& path,
                              vexel::image_decoder&,
                              const vexel::image& img) -> vexel::status {
        std::cout << "File: " << path.string() << "\n";
        std::cout << "Decoded: " << img.width() << "x" << img.height()
                  << " " << vexel::to_string(img.format());
        if (!img.frames().empty()) {
            std::cout << ", " << img.frames().size() << " frame(s)";
        }
        std::cout << "\n";

        if (opts.void_output) {
            return vexel::status::success();
        }

        auto out = output_path_for(path, opts);
        if (!out) {
            return out.error_info();
        }
        auto written = opts.format == output_format::pam ? write_pam(out.value(), img)
                                                         : write_ppm(out.value(), img);
        if (written) {
            std::cout << "Saved: " << out.value().string() << "\n";
        }
        return written;
    };

    auto on_info = [](const std::filesystem::path& path, const vexel::image_info& info) -> vexel::status {
        std::cout << "File: " << path.string() << "\n" << vexel::format_info(info);
        return vexel::status::success();
    };

    const auto summary = opts.info_only ? vexel::inspect_batch(opts.inputs, on_info)
                                        : vexel::decode_batch(opts.inputs, {}, on_decoded);

    std::cout << summary.succeeded << " decoded, " << summary.failed() << " failed\n";
    for (const auto& f : summary.failures) {
        std::cerr << "  " << f.path.string() << ": " << vexel::to_string(f.reason.code)
                  << ": " << f.reason.message << "\n";
    }

    return summary.failed() == 0 ? 0 : 2;
}
