#ifndef IMGRESIZE_RESIZEERROR_HPP
#define IMGRESIZE_RESIZEERROR_HPP

#include <stdexcept>
#include <string>

namespace imgresize {

/**
 * @brief Classification of a failed resize
 */
enum class ErrorKind {
    NotFound,         // input does not resolve to a readable file or directory
    DecodeError,      // file exists but is not a decodable image
    IOError,          // write, permission or directory creation failure
    InvalidArgument,  // non-positive target dimensions
    Other
};

const char* to_string(ErrorKind kind);

/**
 * @brief Exception raised by the codec and directory layers
 *
 * Carries an ErrorKind so the resize boundary can narrow it into a
 * ResizeError without inspecting message text.
 */
class ImageError : public std::runtime_error {
public:
    ImageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Failure value returned across the resize and batch boundaries
 */
struct ResizeError {
    ErrorKind kind = ErrorKind::Other;
    std::string message;
};

} // namespace imgresize

#endif // IMGRESIZE_RESIZEERROR_HPP
