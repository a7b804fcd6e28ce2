#ifndef IMGRESIZE_IMAGEFILESEQUENCE_HPP
#define IMGRESIZE_IMAGEFILESEQUENCE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace imgresize {

/**
 * @brief Extensions accepted by batch mode when none are given
 */
const std::vector<std::string>& default_image_extensions();

/**
 * @brief Case-insensitive suffix match of @p filename against @p extensions
 *
 * Extensions are compared as plain suffixes, so ".png" matches "a.PNG" and
 * "b.tar.png" but not "png".
 */
bool has_accepted_extension(const std::string& filename,
                            const std::vector<std::string>& extensions);

/**
 * @brief How a directory is walked
 */
struct ScanOptions {
    bool recursive = false;
    bool sorted = false;  // lexicographic instead of filesystem order
    std::vector<std::filesystem::path> excluded_dirs;  // never descended into
};

/**
 * @brief Lazy, single-pass sequence of image files in a directory
 *
 * Only regular files whose name carries an accepted extension are yielded.
 * In unsorted mode entries are pulled from the directory iterator on demand;
 * sorted mode has to list everything first. restart() lists the directory
 * again from the beginning.
 *
 * @code
 *   ImageFileSequence files(dir, default_image_extensions());
 *   while (auto path = files.next()) {
 *       process(*path);
 *   }
 * @endcode
 */
class ImageFileSequence {
public:
    /**
     * @throws ImageError (NotFound) if @p directory is missing or unreadable
     */
    ImageFileSequence(std::filesystem::path directory,
                      std::vector<std::string> extensions,
                      ScanOptions options = {});

    /**
     * @brief Next matching file, or std::nullopt once exhausted
     */
    std::optional<std::filesystem::path> next();

    void restart();

    /**
     * @brief Drain the remaining entries into a vector
     */
    std::vector<std::filesystem::path> collect();

    const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    void open();
    bool accepts(const std::filesystem::directory_entry& entry) const;
    bool is_excluded(const std::filesystem::path& dir) const;
    std::optional<std::filesystem::path> next_unsorted();

    std::filesystem::path directory_;
    std::vector<std::string> extensions_;
    ScanOptions options_;

    std::filesystem::directory_iterator flat_it_;
    std::filesystem::recursive_directory_iterator recursive_it_;

    std::vector<std::filesystem::path> sorted_;
    size_t sorted_pos_ = 0;
};

/**
 * @brief Convenience wrapper returning every match at once
 */
std::vector<std::filesystem::path> list_image_files(const std::filesystem::path& directory,
                                                    const std::vector<std::string>& extensions,
                                                    const ScanOptions& options = {});

} // namespace imgresize

#endif // IMGRESIZE_IMAGEFILESEQUENCE_HPP
