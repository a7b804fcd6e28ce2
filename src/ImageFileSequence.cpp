#include "imgresize/ImageFileSequence.hpp"
#include "imgresize/ResizeError.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace imgresize {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

const std::vector<std::string>& default_image_extensions() {
    static const std::vector<std::string> extensions = {
        ".png", ".jpg", ".jpeg", ".bmp", ".gif"
    };
    return extensions;
}

bool has_accepted_extension(const std::string& filename,
                            const std::vector<std::string>& extensions) {
    const std::string lower_name = to_lower(filename);
    return std::any_of(extensions.begin(), extensions.end(),
                       [&lower_name](const std::string& ext) {
                           return !ext.empty() && ends_with(lower_name, to_lower(ext));
                       });
}

ImageFileSequence::ImageFileSequence(fs::path directory,
                                     std::vector<std::string> extensions,
                                     ScanOptions options)
    : directory_(std::move(directory)),
      extensions_(std::move(extensions)),
      options_(std::move(options))
{
    open();
}

void ImageFileSequence::open() {
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        throw ImageError(ErrorKind::NotFound,
                         "Could not find the directory '" + directory_.string() + "'");
    }

    sorted_.clear();
    sorted_pos_ = 0;
    flat_it_ = fs::directory_iterator();
    recursive_it_ = fs::recursive_directory_iterator();

    if (options_.recursive) {
        recursive_it_ = fs::recursive_directory_iterator(
            directory_, fs::directory_options::skip_permission_denied, ec);
    } else {
        flat_it_ = fs::directory_iterator(directory_, ec);
    }

    if (ec) {
        throw ImageError(ErrorKind::NotFound,
                         "Could not read the directory '" + directory_.string() + "': " +
                         ec.message());
    }

    if (options_.sorted) {
        while (auto path = next_unsorted()) {
            sorted_.push_back(std::move(*path));
        }
        std::sort(sorted_.begin(), sorted_.end());
    }
}

void ImageFileSequence::restart() {
    open();
}

bool ImageFileSequence::accepts(const fs::directory_entry& entry) const {
    std::error_code ec;
    return entry.is_regular_file(ec) &&
           has_accepted_extension(entry.path().filename().string(), extensions_);
}

bool ImageFileSequence::is_excluded(const fs::path& dir) const {
    for (const auto& excluded : options_.excluded_dirs) {
        std::error_code ec;
        if (fs::equivalent(dir, excluded, ec)) {
            return true;
        }
    }
    return false;
}

std::optional<fs::path> ImageFileSequence::next_unsorted() {
    std::error_code ec;

    if (options_.recursive) {
        const fs::recursive_directory_iterator end;
        while (recursive_it_ != end) {
            const fs::directory_entry entry = *recursive_it_;
            if (entry.is_directory(ec) && is_excluded(entry.path())) {
                recursive_it_.disable_recursion_pending();
            }
            const bool match = accepts(entry);

            recursive_it_.increment(ec);
            if (ec) {
                recursive_it_ = end;
            }
            if (match) {
                return entry.path();
            }
        }
        return std::nullopt;
    }

    const fs::directory_iterator end;
    while (flat_it_ != end) {
        const fs::directory_entry entry = *flat_it_;
        const bool match = accepts(entry);

        flat_it_.increment(ec);
        if (ec) {
            flat_it_ = end;
        }
        if (match) {
            return entry.path();
        }
    }
    return std::nullopt;
}

std::optional<fs::path> ImageFileSequence::next() {
    if (!options_.sorted) {
        return next_unsorted();
    }
    if (sorted_pos_ < sorted_.size()) {
        return sorted_[sorted_pos_++];
    }
    return std::nullopt;
}

std::vector<fs::path> ImageFileSequence::collect() {
    std::vector<fs::path> paths;
    while (auto path = next()) {
        paths.push_back(std::move(*path));
    }
    return paths;
}

std::vector<fs::path> list_image_files(const fs::path& directory,
                                       const std::vector<std::string>& extensions,
                                       const ScanOptions& options) {
    ImageFileSequence files(directory, extensions, options);
    return files.collect();
}

} // namespace imgresize
