#include "imgresize/ImageResizer.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace imgresize {

namespace {

bool is_readable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    std::ifstream probe(path, std::ios::binary);
    return probe.good();
}

void ensure_parent_directory(const fs::path& output) {
    const fs::path parent = output.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw ImageError(ErrorKind::IOError,
                         "Could not create directory " + parent.string() + ": " + ec.message());
    }
}

ResizeResult fail(ResizeResult result, ErrorKind kind, const std::string& message) {
    result.success = false;
    result.error = ResizeError{kind, message};
    return result;
}

} // anonymous namespace

fs::path derive_output_path(const fs::path& input, Dimensions target) {
    const std::string suffix =
        "_" + std::to_string(target.width) + "x" + std::to_string(target.height);
    return input.parent_path() /
           (input.stem().string() + suffix + input.extension().string());
}

ResizeResult resize_image(const ResizeRequest& request, std::ostream& status) {
    ResizeResult result;
    const std::string input = request.input_path.string();

    if (!request.target.is_positive()) {
        status << "Error: Invalid target size " << request.target.width << " x "
               << request.target.height << "\n";
        return fail(result, ErrorKind::InvalidArgument,
                    "Target dimensions must be positive");
    }

    if (!is_readable_file(request.input_path)) {
        status << "Error: Could not find the file '" << input << "'\n";
        return fail(result, ErrorKind::NotFound, "Could not find the file '" + input + "'");
    }

    try {
        result.output_path = request.output_path
            ? *request.output_path
            : derive_output_path(request.input_path, request.target);

        Image img = ImageCodec::load(input);
        result.original = img.dimensions();
        status << "Original image size: " << img.width << " x " << img.height << "\n";

        if (result.original != kExpectedSource) {
            status << "Warning: Input image is not " << kExpectedSource.width << "x"
                   << kExpectedSource.height << ". Proceeding with resize...\n";
        }

        const ImageFormat format = ImageCodec::detect_format(result.output_path.string());
        if (format == ImageFormat::UNKNOWN) {
            throw ImageError(ErrorKind::Other,
                             "Unsupported output format '" +
                             result.output_path.extension().string() + "'");
        }

        Image resized = ImageCodec::resize(img, request.target.width, request.target.height);
        img = Image();  // release the source bitmap before encoding

        ensure_parent_directory(result.output_path);
        ImageCodec::save(resized, result.output_path.string(), format, request.jpeg_quality);

        result.output = resized.dimensions();
        result.success = true;

        status << "Successfully resized image to " << result.output.width << " x "
               << result.output.height << "\n";
        status << "Saved to: " << result.output_path.string() << "\n";
        return result;

    } catch (const ImageError& e) {
        switch (e.kind()) {
            case ErrorKind::DecodeError:
                status << "Error: Could not decode '" << input << "' - " << e.what() << "\n";
                break;
            case ErrorKind::IOError:
                status << "Error: Could not write '" << result.output_path.string()
                       << "' - " << e.what() << "\n";
                break;
            default:
                status << "Error: " << e.what() << "\n";
                break;
        }
        return fail(result, e.kind(), e.what());

    } catch (const fs::filesystem_error& e) {
        status << "Error: " << e.what() << "\n";
        return fail(result, ErrorKind::IOError, e.what());

    } catch (const std::exception& e) {
        status << "Error: An unexpected error occurred - " << e.what() << "\n";
        return fail(result, ErrorKind::Other, e.what());
    }
}

ResizeResult resize_image(const ResizeRequest& request) {
    return resize_image(request, std::cout);
}

} // namespace imgresize
