#include "CommandLine.hpp"

#include "imgresize/AssetLibrary.hpp"
#include "imgresize/BatchProcessor.hpp"
#include "imgresize/ImageResizer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <ostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace imgresize::cli {

namespace {

const std::string& require_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

int parse_positive_int(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
    if (consumed != text.size() || value <= 0) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
    return value;
}

bool has_single_image_extension(const std::string& input) {
    static const std::vector<std::string> extensions = {
        "png", "jpg", "jpeg", "bmp", "gif", "tiff"
    };

    const auto dot = input.rfind('.');
    if (dot == std::string::npos) {
        return false;
    }
    std::string ext = input.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

void set_input(Options& options, const std::string& value) {
    if (!options.input.empty()) {
        throw std::invalid_argument("Input given twice: '" + options.input + "' and '" + value + "'");
    }
    options.input = value;
}

// Throws for options the mode would otherwise ignore
void reject_unused_options(Mode mode, const Options& options) {
    const char* flag = nullptr;
    if (mode == Mode::AssetLibrary) {
        if (options.output) {
            throw std::invalid_argument("-f does not take an output path: '" + *options.output + "'");
        }
        flag = options.recursive ? "--recursive" : options.sorted ? "--sorted" : nullptr;
    } else if (mode == Mode::Single) {
        flag = options.recursive ? "--recursive"
             : options.sorted ? "--sorted"
             : options.threads != 1 ? "--threads" : nullptr;
    }
    if (flag != nullptr) {
        throw std::invalid_argument(std::string(flag) + " is not used when resizing " +
                                    (mode == Mode::Single ? "a single image" : "an asset library"));
    }
}

} // anonymous namespace

Dimensions parse_size(const std::string& text) {
    const auto sep = text.find_first_of("xX");
    if (sep == std::string::npos) {
        throw std::invalid_argument("Invalid size '" + text + "', expected WxH");
    }
    return {parse_positive_int(text.substr(0, sep), "width"),
            parse_positive_int(text.substr(sep + 1), "height")};
}

Options parse_command_line(const std::vector<std::string>& args) {
    Options options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.mode = Mode::Help;
            return options;
        } else if (arg == "-f") {
            set_input(options, require_value(args, i));
            options.mode = Mode::AssetLibrary;
        } else if (arg == "-b" || arg == "--batch") {
            set_input(options, require_value(args, i));
            options.mode = Mode::Batch;
        } else if (arg == "-s" || arg == "--size") {
            options.size = parse_size(require_value(args, i));
        } else if (arg == "-j" || arg == "--threads") {
            options.threads = static_cast<size_t>(
                parse_positive_int(require_value(args, i), "thread count"));
        } else if (arg == "-r" || arg == "--recursive") {
            options.recursive = true;
        } else if (arg == "--sorted") {
            options.sorted = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (options.input.empty()) {
            options.input = arg;
        } else if (!options.output) {
            options.output = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (options.mode == Mode::Usage && !options.input.empty()) {
        options.mode = Mode::Auto;
    }
    reject_unused_options(options.mode, options);
    return options;
}

Mode resolve_mode(const Options& options) {
    if (options.mode != Mode::Auto) {
        return options.mode;
    }

    if (has_single_image_extension(options.input)) {
        return Mode::Single;
    }

    std::error_code ec;
    if (fs::is_directory(options.input, ec) && !fs::is_empty(options.input, ec) && !ec) {
        return Mode::Batch;
    }
    return Mode::Invalid;
}

void print_usage(std::ostream& out, const std::string& prog) {
    out << "Usage: " << prog << " <input_image> [output_image]\n"
        << "Example: " << prog << " image_2048.png image_1024.png\n";
}

void print_help(std::ostream& out, const std::string& prog) {
    print_usage(out, prog);
    out << "\nOptions:\n"
        << "  -b, --batch DIR       Resize every image in DIR (output: [output] or DIR/resized_1024)\n"
        << "  -f ROOT               Process a folder of asset folders (2K -> 1k, USD files to USD)\n"
        << "  -s, --size WxH        Target size (default: 1024x1024)\n"
        << "  -j, --threads N       Worker threads for batch modes (default: 1)\n"
        << "  -r, --recursive       Descend into subdirectories in batch mode\n"
        << "      --sorted          Process batch files in name order\n"
        << "  -h, --help            Show this help\n"
        << "\nA directory given as <input_image> is processed in batch mode.\n"
        << "Output is written as PNG, JPEG, BMP or TGA, chosen by extension. GIF files\n"
        << "can be read but not written, so batch mode reports each GIF as failed.\n"
        << "TIFF files are neither read nor written.\n"
        << "Help: " << prog << " -h\n";
}

int run(const Options& options, const std::string& prog,
        std::ostream& out, std::ostream& err) {
    const Mode mode = resolve_mode(options);
    try {
        reject_unused_options(mode, options);
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    switch (mode) {
        case Mode::Usage:
            print_usage(out, prog);
            return 1;

        case Mode::Help:
            print_help(out, prog);
            return 1;

        case Mode::Single: {
            ResizeRequest request;
            request.input_path = options.input;
            if (options.output) {
                request.output_path = fs::path(*options.output);
            }
            request.target = options.size;
            return resize_image(request, out).success ? 0 : 1;
        }

        case Mode::Batch: {
            BatchJob job;
            job.input_dir = options.input;
            if (options.output) {
                job.output_dir = fs::path(*options.output);
            }
            job.target = options.size;
            job.num_threads = options.threads;
            job.scan.recursive = options.recursive;
            job.scan.sorted = options.sorted;
            return batch_resize(job, out).ok() ? 0 : 1;
        }

        case Mode::AssetLibrary: {
            AssetLibraryOptions asset_options;
            asset_options.target = options.size;
            asset_options.num_threads = options.threads;
            AssetLibraryResult result = process_asset_library(options.input, asset_options, out);
            out << "\nAsset folders: " << result.folders
                << ", images processed: " << result.processed
                << ", failures: " << result.failures.size() << "\n";
            return result.ok() ? 0 : 1;
        }

        case Mode::Auto:
        case Mode::Invalid:
            break;
    }

    err << "Error: '" << options.input << "' is not a valid image file\n";
    return 1;
}

} // namespace imgresize::cli
