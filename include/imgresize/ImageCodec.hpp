#ifndef IMGRESIZE_IMAGECODEC_HPP
#define IMGRESIZE_IMAGECODEC_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace imgresize {

/**
 * @brief Output formats the encoder can write
 */
enum class ImageFormat {
    PNG,
    JPEG,
    BMP,
    TGA,
    UNKNOWN
};

/**
 * @brief Width/height pair used for source and target resolutions
 */
struct Dimensions {
    int width = 0;
    int height = 0;

    bool is_positive() const { return width > 0 && height > 0; }

    bool operator==(const Dimensions& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Dimensions& other) const { return !(*this == other); }
};

constexpr Dimensions kDefaultTarget{1024, 1024};
constexpr Dimensions kExpectedSource{2048, 2048};

/**
 * @brief Decoded 8-bit image
 *
 * Pixels are row-major and tightly packed, @c channels bytes per pixel
 * (1=grey, 2=grey+alpha, 3=RGB, 4=RGBA).
 */
struct Image {
    int width;
    int height;
    int channels;
    std::vector<uint8_t> data;

    Image() : width(0), height(0), channels(0) {}

    Image(int w, int h, int c)
        : width(w), height(h), channels(c),
          data(static_cast<size_t>(w) * h * c) {}

    Image(int w, int h, int c, std::vector<uint8_t> d)
        : width(w), height(h), channels(c), data(std::move(d)) {}

    bool is_valid() const {
        return width > 0 && height > 0 && channels > 0 && channels <= 4 &&
               data.size() == static_cast<size_t>(width) * height * channels;
    }

    size_t size_bytes() const { return data.size(); }

    Dimensions dimensions() const { return {width, height}; }
};

/**
 * @brief Image decode, encode and resample operations backed by stb
 *
 * All members are stateless and safe to call from several threads at once.
 * Failures are reported by throwing ImageError.
 */
class ImageCodec {
public:
    /**
     * @brief Decode an image file, format sniffed from its content
     * @param path File path to image
     * @return Decoded image with its native channel count
     * @throws ImageError (DecodeError) if the file cannot be decoded
     */
    static Image load(const std::string& path);

    /**
     * @brief Encode an image to a file
     * @param img Image to save
     * @param path Output file path
     * @param format Output format
     * @param quality JPEG quality (1-100, ignored for other formats)
     * @throws ImageError (IOError) if writing fails, (Other) for UNKNOWN format
     */
    static void save(const Image& img, const std::string& path,
                     ImageFormat format, int quality = 90);

    /**
     * @brief Resample to new dimensions with a Lanczos-3 filter
     *
     * Width and height are remapped independently, so a change of aspect
     * ratio stretches the picture. Requests for the current size return an
     * exact copy.
     *
     * @throws ImageError (InvalidArgument) for non-positive dimensions
     */
    static Image resize(const Image& src, int new_width, int new_height);

    /**
     * @brief Detect output format from file extension (case-insensitive)
     */
    static ImageFormat detect_format(const std::string& path);
};

const char* to_string(ImageFormat format);

} // namespace imgresize

#endif // IMGRESIZE_IMAGECODEC_HPP
