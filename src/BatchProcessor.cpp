#include "imgresize/BatchProcessor.hpp"
#include "imgresize/ImageResizer.hpp"
#include "imgresize/ThreadPool.hpp"

#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace imgresize {

namespace {

struct FileOutcome {
    ResizeResult result;
    std::string log;
};

ResizeRequest make_request(const BatchJob& job, const fs::path& input, const fs::path& output_dir) {
    ResizeRequest request;
    request.input_path = input;
    request.output_path = output_dir / input.lexically_relative(job.input_dir);
    request.target = job.target;
    request.jpeg_quality = job.jpeg_quality;
    return request;
}

void record(BatchResult& batch, const fs::path& input, const ResizeResult& result) {
    if (result.success) {
        ++batch.processed;
    } else {
        batch.failures.push_back({input, result.error.value_or(ResizeError{})});
    }
}

void run_sequential(const BatchJob& job, ImageFileSequence& files,
                    BatchResult& batch, std::ostream& status) {
    while (auto input = files.next()) {
        status << "\nProcessing: " << input->lexically_relative(job.input_dir).string() << "\n";
        record(batch, *input, resize_image(make_request(job, *input, batch.output_dir), status));
    }
}

void run_parallel(const BatchJob& job, ImageFileSequence& files,
                  BatchResult& batch, std::ostream& status) {
    std::vector<fs::path> inputs;
    std::vector<std::future<FileOutcome>> futures;

    {
        ThreadPool pool(job.num_threads);

        while (auto input = files.next()) {
            ResizeRequest request = make_request(job, *input, batch.output_dir);
            inputs.push_back(*input);
            futures.push_back(pool.submit([request]() {
                std::ostringstream log;
                FileOutcome outcome;
                outcome.result = resize_image(request, log);
                outcome.log = log.str();
                return outcome;
            }));
        }

        // Logs are replayed in submission order, not completion order
        for (size_t i = 0; i < futures.size(); ++i) {
            status << "\nProcessing: " << inputs[i].lexically_relative(job.input_dir).string()
                   << "\n";
            try {
                FileOutcome outcome = futures[i].get();
                status << outcome.log;
                record(batch, inputs[i], outcome.result);
            } catch (const std::exception& e) {
                status << "Error: An unexpected error occurred - " << e.what() << "\n";
                batch.failures.push_back({inputs[i], ResizeError{ErrorKind::Other, e.what()}});
            }
        }
    }
}

} // anonymous namespace

fs::path default_batch_output_dir(const fs::path& input_dir) {
    return input_dir / kDefaultBatchDirName;
}

BatchResult batch_resize(const BatchJob& job, std::ostream& status) {
    BatchResult batch;
    batch.output_dir = job.output_dir ? *job.output_dir : default_batch_output_dir(job.input_dir);

    ScanOptions scan = job.scan;
    scan.excluded_dirs.push_back(batch.output_dir);

    std::optional<ImageFileSequence> files;
    try {
        files.emplace(job.input_dir, job.extensions, scan);
    } catch (const ImageError& e) {
        status << "Error: " << e.what() << "\n";
        batch.error = ResizeError{e.kind(), e.what()};
        return batch;
    }

    std::error_code ec;
    fs::create_directories(batch.output_dir, ec);
    if (ec) {
        const std::string message =
            "Could not create output folder '" + batch.output_dir.string() + "': " + ec.message();
        status << "Error: " << message << "\n";
        batch.error = ResizeError{ErrorKind::IOError, message};
        return batch;
    }

    try {
        if (job.num_threads > 1) {
            run_parallel(job, *files, batch, status);
        } else {
            run_sequential(job, *files, batch, status);
        }
    } catch (const std::exception& e) {
        // Only directory iteration or pool start-up can get here
        status << "Error: An unexpected error occurred - " << e.what() << "\n";
        batch.error = ResizeError{ErrorKind::Other, e.what()};
    }

    status << "\n" << std::string(50, '=') << "\n";
    status << "Batch processing complete! Processed " << batch.processed << " images.\n";
    if (!batch.failures.empty()) {
        status << "Failed: " << batch.failures.size() << " images.\n";
    }
    status << "Output folder: " << batch.output_dir.string() << "\n";

    return batch;
}

BatchResult batch_resize(const BatchJob& job) {
    return batch_resize(job, std::cout);
}

} // namespace imgresize
