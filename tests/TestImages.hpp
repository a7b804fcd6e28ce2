#ifndef IMGRESIZE_TESTS_TESTIMAGES_HPP
#define IMGRESIZE_TESTS_TESTIMAGES_HPP

#include "imgresize/ImageCodec.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace imgresize::testing {

/**
 * @brief Scratch directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("imgresize_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Diagonal gradient, so resampled output is not trivially constant
inline Image make_gradient(int width, int height, int channels = 3) {
    Image img(width, height, channels);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            for (int c = 0; c < channels; ++c) {
                const size_t idx = (static_cast<size_t>(y) * width + x) * channels + c;
                img.data[idx] = static_cast<uint8_t>((x * 255 / width + y * 127 / height + c * 40) % 256);
            }
        }
    }
    return img;
}

inline Image make_solid(int width, int height, int channels, uint8_t value) {
    Image img(width, height, channels);
    std::fill(img.data.begin(), img.data.end(), value);
    return img;
}

inline void write_png(const std::filesystem::path& path, int width, int height, int channels = 3) {
    ImageCodec::save(make_gradient(width, height, channels), path.string(), ImageFormat::PNG);
}

inline void write_garbage(const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary);
    out << "this is not an image, just some bytes pretending to be one";
}

} // namespace imgresize::testing

#endif // IMGRESIZE_TESTS_TESTIMAGES_HPP
