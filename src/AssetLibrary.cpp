#include "imgresize/AssetLibrary.hpp"

#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

namespace imgresize {

namespace {

bool make_dir(const fs::path& dir, AssetLibraryResult& result, std::ostream& status) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        const std::string message =
            "Could not create folder '" + dir.string() + "': " + ec.message();
        status << "Error: " << message << "\n";
        result.failures.push_back({dir, ResizeError{ErrorKind::IOError, message}});
        return false;
    }
    return true;
}

void move_into(const fs::path& file, const fs::path& dir,
               AssetLibraryResult& result, std::ostream& status) {
    std::error_code ec;
    fs::rename(file, dir / file.filename(), ec);
    if (ec) {
        const std::string message =
            "Could not move '" + file.string() + "' to '" + dir.string() + "': " + ec.message();
        status << "Error: " << message << "\n";
        result.failures.push_back({file, ResizeError{ErrorKind::IOError, message}});
    }
}

void sort_loose_files(const fs::path& folder, const fs::path& source_dir, const fs::path& usd_dir,
                      const AssetLibraryOptions& options,
                      AssetLibraryResult& result, std::ostream& status) {
    // Snapshot first: moving entries while iterating the same directory is unspecified
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        const std::string message = "Could not list '" + folder.string() + "': " + ec.message();
        status << "Error: " << message << "\n";
        result.failures.push_back({folder, ResizeError{ErrorKind::IOError, message}});
    }

    for (const auto& file : files) {
        const std::string name = file.filename().string();
        if (has_accepted_extension(name, options.image_extensions)) {
            move_into(file, source_dir, result, status);
        } else if (has_accepted_extension(name, options.usd_extensions)) {
            move_into(file, usd_dir, result, status);
        }
    }
}

} // anonymous namespace

AssetLibraryResult process_asset_library(const fs::path& root,
                                         const AssetLibraryOptions& options,
                                         std::ostream& status) {
    AssetLibraryResult result;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        const std::string message = "Could not find the directory '" + root.string() + "'";
        status << "Error: " << message << "\n";
        result.error = ResizeError{ErrorKind::NotFound, message};
        return result;
    }

    std::vector<fs::path> folders;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            folders.push_back(it->path());
        }
    }
    if (ec) {
        const std::string message = "Could not read the directory '" + root.string() + "': " +
                                    ec.message();
        status << "Error: " << message << "\n";
        result.error = ResizeError{ErrorKind::NotFound, message};
        return result;
    }

    for (const auto& folder : folders) {
        status << "\nAsset folder: " << folder.filename().string() << "\n";
        ++result.folders;

        const fs::path source_dir = folder / options.source_dir;
        const fs::path resized_dir = folder / options.resized_dir;
        const fs::path usd_dir = folder / options.usd_dir;

        if (!make_dir(usd_dir, result, status) ||
            !make_dir(source_dir, result, status) ||
            !make_dir(resized_dir, result, status)) {
            continue;
        }

        sort_loose_files(folder, source_dir, usd_dir, options, result, status);

        BatchJob job;
        job.input_dir = source_dir;
        job.output_dir = resized_dir;
        job.extensions = options.image_extensions;
        job.target = options.target;
        job.num_threads = options.num_threads;

        BatchResult batch = batch_resize(job, status);
        result.processed += batch.processed;
        result.failures.insert(result.failures.end(),
                               batch.failures.begin(), batch.failures.end());
        if (batch.error) {
            result.failures.push_back({source_dir, *batch.error});
        }
    }

    return result;
}

} // namespace imgresize
