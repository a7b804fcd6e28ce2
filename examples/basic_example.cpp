#include "imgresize/BatchProcessor.hpp"
#include "imgresize/ImageResizer.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int main() {
    const fs::path work = fs::temp_directory_path() / "imgresize_example";
    fs::create_directories(work);

    // Example 1: create a 2048x2048 source image
    std::cout << "Example 1: Writing a 2048x2048 test image\n";
    imgresize::Image source(2048, 2048, 3);
    for (int y = 0; y < source.height; ++y) {
        for (int x = 0; x < source.width; ++x) {
            uint8_t* px = &source.data[(static_cast<size_t>(y) * source.width + x) * 3];
            px[0] = static_cast<uint8_t>(x / 8);
            px[1] = static_cast<uint8_t>(y / 8);
            px[2] = 128;
        }
    }
    try {
        imgresize::ImageCodec::save(source, (work / "texture.png").string(),
                                    imgresize::ImageFormat::PNG);
    } catch (const imgresize::ImageError& e) {
        std::cerr << "Could not write test image: " << e.what() << "\n";
        return 1;
    }

    // Example 2: single resize, output path derived as texture_1024x1024.png
    std::cout << "\nExample 2: Single image\n";
    imgresize::ResizeRequest request;
    request.input_path = work / "texture.png";
    imgresize::ResizeResult result = imgresize::resize_image(request);
    if (!result) {
        std::cerr << "Resize failed: " << result.error->message << "\n";
        return 1;
    }

    // Example 3: batch over the folder, two worker threads
    std::cout << "\nExample 3: Batch\n";
    imgresize::BatchJob job;
    job.input_dir = work;
    job.num_threads = 2;
    imgresize::BatchResult batch = imgresize::batch_resize(job);

    std::cout << "\nResized " << batch.processed << " of " << batch.attempted()
              << " images into " << batch.output_dir << "\n";
    return batch.ok() ? 0 : 1;
}
