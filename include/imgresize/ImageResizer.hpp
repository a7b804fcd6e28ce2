#ifndef IMGRESIZE_IMAGERESIZER_HPP
#define IMGRESIZE_IMAGERESIZER_HPP

#include "imgresize/ImageCodec.hpp"
#include "imgresize/ResizeError.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace imgresize {

/**
 * @brief One resize of one file
 */
struct ResizeRequest {
    std::filesystem::path input_path;
    std::optional<std::filesystem::path> output_path;  // derived when empty
    Dimensions target = kDefaultTarget;
    int jpeg_quality = 90;
};

/**
 * @brief Outcome of resize_image()
 *
 * On failure @c error is set and @c output_path holds the path that would
 * have been written, if it was resolved before the failure.
 */
struct ResizeResult {
    bool success = false;
    std::optional<ResizeError> error;
    std::filesystem::path output_path;
    Dimensions original;
    Dimensions output;

    explicit operator bool() const { return success; }
};

/**
 * @brief Default output path: @c _{W}x{H} inserted before the extension
 *
 * "dir/photo.jpg" with 1024x1024 becomes "dir/photo_1024x1024.jpg".
 */
std::filesystem::path derive_output_path(const std::filesystem::path& input,
                                         Dimensions target = kDefaultTarget);

/**
 * @brief Decode, resample and re-encode one image
 *
 * Progress lines and error messages are written to @p status. Every failure
 * is returned in the result; no exception leaves this function.
 */
ResizeResult resize_image(const ResizeRequest& request, std::ostream& status);

/**
 * @brief Convenience overload printing to std::cout
 */
ResizeResult resize_image(const ResizeRequest& request);

} // namespace imgresize

#endif // IMGRESIZE_IMAGERESIZER_HPP
