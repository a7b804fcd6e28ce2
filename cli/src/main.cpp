#include "CommandLine.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::string prog = argc > 0
        ? std::filesystem::path(argv[0]).filename().string()
        : std::string("imgresize");

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    imgresize::cli::Options options;
    try {
        options = imgresize::cli::parse_command_line(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        imgresize::cli::print_usage(std::cerr, prog);
        return 1;
    }

    return imgresize::cli::run(options, prog, std::cout, std::cerr);
}
