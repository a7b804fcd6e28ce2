#ifndef IMGRESIZE_CLI_COMMANDLINE_HPP
#define IMGRESIZE_CLI_COMMANDLINE_HPP

#include "imgresize/ImageCodec.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace imgresize::cli {

/**
 * @brief What the executable was asked to do
 *
 * Auto means a positional input whose kind (file or directory) is settled
 * by resolve_mode() against the filesystem.
 */
enum class Mode {
    Usage,         // no input given
    Help,
    Auto,
    Single,
    Batch,
    AssetLibrary,
    Invalid        // input is neither an image file name nor a usable directory
};

struct Options {
    Mode mode = Mode::Usage;
    std::string input;
    std::optional<std::string> output;
    Dimensions size = kDefaultTarget;
    size_t threads = 1;
    bool recursive = false;
    bool sorted = false;
};

/**
 * @brief Parse argv into Options
 * @throws std::invalid_argument for unknown flags, malformed values, a second
 *         input, or options an explicit -b / -f mode does not use
 */
Options parse_command_line(const std::vector<std::string>& args);

/**
 * @brief Parse "WxH" (e.g. "1024x1024")
 * @throws std::invalid_argument unless both parts are positive integers
 */
Dimensions parse_size(const std::string& text);

/**
 * @brief Turn Mode::Auto into Single, Batch or Invalid
 *
 * A name ending in png, jpg, jpeg, bmp, gif or tiff is a single image even
 * if it does not exist; a non-empty directory is a batch.
 */
Mode resolve_mode(const Options& options);

void print_usage(std::ostream& out, const std::string& prog);
void print_help(std::ostream& out, const std::string& prog);

/**
 * @brief Run the resolved command and return the process exit code
 *
 * Options the resolved mode does not use (for example -r with a single
 * image) are reported on err and give exit code 1.
 */
int run(const Options& options, const std::string& prog,
        std::ostream& out, std::ostream& err);

} // namespace imgresize::cli

#endif // IMGRESIZE_CLI_COMMANDLINE_HPP
