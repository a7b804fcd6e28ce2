#include "imgresize/BatchProcessor.hpp"
#include "imgresize/ImageCodec.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void write_source_images(const fs::path& dir, size_t count, int size) {
    imgresize::Image img(size, size, 3);
    for (size_t i = 0; i < img.data.size(); ++i) {
        img.data[i] = static_cast<uint8_t>((i * 7) % 256);
    }
    for (size_t n = 0; n < count; ++n) {
        imgresize::ImageCodec::save(img, (dir / ("src_" + std::to_string(n) + ".png")).string(),
                                    imgresize::ImageFormat::PNG);
    }
}

void benchmark_batch(const fs::path& input, size_t num_threads, size_t num_images) {
    imgresize::BatchJob job;
    job.input_dir = input;
    job.output_dir = input / ("out_" + std::to_string(num_threads));
    job.num_threads = num_threads;

    std::ostringstream status;  // keep the per-file log out of the table

    auto start = std::chrono::high_resolution_clock::now();
    imgresize::BatchResult result = imgresize::batch_resize(job, status);
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    double images_per_second = duration.count() > 0
        ? (result.processed * 1000.0) / duration.count()
        : 0.0;

    std::cout << std::setw(12) << num_threads
              << std::setw(15) << num_images
              << std::setw(15) << duration.count()
              << std::setw(20) << std::fixed << std::setprecision(2) << images_per_second
              << "\n";
}

} // namespace

int main() {
    const size_t NUM_IMAGES = 8;
    const int SOURCE_SIZE = 2048;

    const fs::path work = fs::temp_directory_path() / "imgresize_benchmark";
    fs::create_directories(work);

    std::cout << "Batch Resize Benchmark\n";
    std::cout << "======================\n\n";
    std::cout << "Generating " << NUM_IMAGES << " images of " << SOURCE_SIZE << "x" << SOURCE_SIZE
              << "...\n\n";

    try {
        write_source_images(work, NUM_IMAGES, SOURCE_SIZE);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    std::cout << std::setw(12) << "Threads"
              << std::setw(15) << "Images"
              << std::setw(15) << "Time (ms)"
              << std::setw(20) << "Images/second"
              << "\n";
    std::cout << std::string(62, '-') << "\n";

    for (size_t threads : {1, 2, 4, 8}) {
        benchmark_batch(work, threads, NUM_IMAGES);
    }

    std::error_code ec;
    fs::remove_all(work, ec);

    std::cout << "\n";
    return 0;
}
