#ifndef IMGRESIZE_BATCHPROCESSOR_HPP
#define IMGRESIZE_BATCHPROCESSOR_HPP

#include "imgresize/ImageCodec.hpp"
#include "imgresize/ImageFileSequence.hpp"
#include "imgresize/ResizeError.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace imgresize {

/**
 * @brief Name of the output directory created under the input directory
 */
inline constexpr const char* kDefaultBatchDirName = "resized_1024";

/**
 * @brief Resize every matching file of one directory
 */
struct BatchJob {
    std::filesystem::path input_dir;
    std::optional<std::filesystem::path> output_dir;  // input_dir/resized_1024 if empty
    std::vector<std::string> extensions = default_image_extensions();
    Dimensions target = kDefaultTarget;
    size_t num_threads = 1;  // 0 or 1 runs sequentially
    ScanOptions scan;
    int jpeg_quality = 90;
};

struct BatchFailure {
    std::filesystem::path input_path;
    ResizeError error;
};

/**
 * @brief Aggregate outcome of batch_resize()
 *
 * @c error is only set when the job itself could not run (missing input
 * directory, output directory not creatable). Per-file failures never set
 * it; they are listed in @c failures.
 */
struct BatchResult {
    size_t processed = 0;
    std::filesystem::path output_dir;
    std::vector<BatchFailure> failures;
    std::optional<ResizeError> error;

    bool ok() const { return !error.has_value(); }
    size_t attempted() const { return processed + failures.size(); }
};

std::filesystem::path default_batch_output_dir(const std::filesystem::path& input_dir);

/**
 * @brief Resize every image in @p job.input_dir into the output directory
 *
 * Each file keeps its name (its relative path when scanning recursively).
 * A failing file is logged, recorded and skipped. With more than one thread
 * the files are processed on a ThreadPool; status output is still emitted
 * per file in enumeration order. Never throws for per-file failures.
 */
BatchResult batch_resize(const BatchJob& job, std::ostream& status);

BatchResult batch_resize(const BatchJob& job);

} // namespace imgresize

#endif // IMGRESIZE_BATCHPROCESSOR_HPP
