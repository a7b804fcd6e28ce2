#ifndef IMGRESIZE_ASSETLIBRARY_HPP
#define IMGRESIZE_ASSETLIBRARY_HPP

#include "imgresize/BatchProcessor.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace imgresize {

/**
 * @brief Layout of one asset folder after processing
 *
 * Full-size textures end up in @c source_dir, the resized copies in
 * @c resized_dir and scene description files in @c usd_dir.
 */
struct AssetLibraryOptions {
    std::string source_dir = "2K";
    std::string resized_dir = "1k";
    std::string usd_dir = "USD";
    std::vector<std::string> image_extensions = default_image_extensions();
    std::vector<std::string> usd_extensions = {".usda", ".usdc", ".usdz"};
    Dimensions target = kDefaultTarget;
    size_t num_threads = 1;
};

struct AssetLibraryResult {
    size_t folders = 0;
    size_t processed = 0;
    std::vector<BatchFailure> failures;
    std::optional<ResizeError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief Normalise and resize a directory of asset folders
 *
 * For each directory directly under @p root: create the 2K, 1k and USD
 * subfolders, move loose textures into 2K and USD files into USD, then
 * batch-resize 2K into 1k. Files that cannot be moved are recorded as
 * IOError failures and left in place.
 */
AssetLibraryResult process_asset_library(const std::filesystem::path& root,
                                         const AssetLibraryOptions& options,
                                         std::ostream& status);

} // namespace imgresize

#endif // IMGRESIZE_ASSETLIBRARY_HPP
