#include "imgresize/ImageCodec.hpp"
#include "imgresize/ResizeError.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

// Include stb headers (implementations are in stb_impl.cpp)
#include "stb_image.h"
#include "stb_image_write.h"
#include "stb_image_resize2.h"

namespace fs = std::filesystem;

namespace imgresize {

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kLanczosLobes = 3.0f;

// Lanczos-3 kernel: sinc(x) * sinc(x / 3) on [-3, 3]. stb scales the
// support itself when downsampling, so the scale argument is unused.
float lanczos3_kernel(float x, float /*scale*/, void* /*user_data*/) {
    x = std::fabs(x);
    if (x < 1e-6f) {
        return 1.0f;
    }
    if (x >= kLanczosLobes) {
        return 0.0f;
    }
    const float pi_x = kPi * x;
    return kLanczosLobes * std::sin(pi_x) * std::sin(pi_x / kLanczosLobes) / (pi_x * pi_x);
}

float lanczos3_support(float /*scale*/, void* /*user_data*/) {
    return kLanczosLobes;
}

stbir_pixel_layout layout_for_channels(int channels) {
    switch (channels) {
        case 1: return STBIR_1CHANNEL;
        case 2: return STBIR_RA;
        case 3: return STBIR_RGB;
        case 4: return STBIR_RGBA;
        default:
            throw ImageError(ErrorKind::Other,
                             "Unsupported channel count: " + std::to_string(channels));
    }
}

} // anonymous namespace

const char* to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:
            return "PNG";
        case ImageFormat::JPEG:
            return "JPEG";
        case ImageFormat::BMP:
            return "BMP";
        case ImageFormat::TGA:
            return "TGA";
        case ImageFormat::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Image ImageCodec::load(const std::string& path) {
    int width, height, channels;
    uint8_t* data = stbi_load(path.c_str(), &width, &height, &channels, 0);

    if (!data) {
        throw ImageError(ErrorKind::DecodeError,
                         std::string("Failed to load image: ") + stbi_failure_reason());
    }

    // Copy data to vector and free stbi memory
    size_t data_size = static_cast<size_t>(width) * height * channels;
    std::vector<uint8_t> image_data(data, data + data_size);
    stbi_image_free(data);

    return Image(width, height, channels, std::move(image_data));
}

void ImageCodec::save(const Image& img, const std::string& path,
                      ImageFormat format, int quality) {
    if (!img.is_valid()) {
        throw ImageError(ErrorKind::Other, "Cannot save invalid image");
    }

    int success = 0;
    switch (format) {
        case ImageFormat::PNG:
            success = stbi_write_png(path.c_str(), img.width, img.height, img.channels,
                                     img.data.data(), img.width * img.channels);
            break;
        case ImageFormat::JPEG:
            success = stbi_write_jpg(path.c_str(), img.width, img.height, img.channels,
                                     img.data.data(), std::clamp(quality, 1, 100));
            break;
        case ImageFormat::BMP:
            success = stbi_write_bmp(path.c_str(), img.width, img.height, img.channels,
                                     img.data.data());
            break;
        case ImageFormat::TGA:
            success = stbi_write_tga(path.c_str(), img.width, img.height, img.channels,
                                     img.data.data());
            break;
        case ImageFormat::UNKNOWN:
            throw ImageError(ErrorKind::Other, "Unsupported output format for " + path);
    }

    if (!success) {
        throw ImageError(ErrorKind::IOError, "Failed to save image to " + path);
    }
}

Image ImageCodec::resize(const Image& src, int new_width, int new_height) {
    if (new_width <= 0 || new_height <= 0) {
        throw ImageError(ErrorKind::InvalidArgument,
                         "Invalid resize dimensions: " + std::to_string(new_width) +
                         " x " + std::to_string(new_height));
    }

    if (!src.is_valid()) {
        throw ImageError(ErrorKind::Other, "Cannot resize invalid image");
    }

    // Same size: skip resampling so the pixels round-trip exactly
    if (src.width == new_width && src.height == new_height) {
        return src;
    }

    Image result(new_width, new_height, src.channels);

    STBIR_RESIZE plan;
    stbir_resize_init(&plan,
                      src.data.data(), src.width, src.height, 0,
                      result.data.data(), new_width, new_height, 0,
                      layout_for_channels(src.channels), STBIR_TYPE_UINT8);
    stbir_set_edgemodes(&plan, STBIR_EDGE_CLAMP, STBIR_EDGE_CLAMP);
    stbir_set_filter_callbacks(&plan,
                               lanczos3_kernel, lanczos3_support,
                               lanczos3_kernel, lanczos3_support);

    if (!stbir_resize_extended(&plan)) {
        throw ImageError(ErrorKind::Other, "Failed to resize image");
    }

    return result;
}

ImageFormat ImageCodec::detect_format(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".png") return ImageFormat::PNG;
    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::JPEG;
    if (ext == ".bmp") return ImageFormat::BMP;
    if (ext == ".tga") return ImageFormat::TGA;

    return ImageFormat::UNKNOWN;
}

} // namespace imgresize
