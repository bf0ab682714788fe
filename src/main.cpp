#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "ConfigParser.hpp"
#include "Organizer.hpp"

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config-root]" << std::endl;
        return EXIT_FAILURE;
    }

    // The config folder sits under the given root, or under the working directory.
    std::error_code cwdErr;
    const std::filesystem::path configRoot = argc == 2 ? std::filesystem::path(argv[1])
                                                       : std::filesystem::current_path(cwdErr);
    if (cwdErr) {
        std::cerr << "Unable to determine the working directory: " << cwdErr.message() << std::endl;
        return EXIT_FAILURE;
    }

    ConfigParser parser;
    if (!parser.load(configRoot.string())) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    if (parser.getTransferPolicy().dryRun) {
        std::cout << "Dry run enabled; no files will be changed." << std::endl;
    }

    Organizer organizer(parser);

    std::cout << "Organizing films..." << std::endl;
    if (!organizer.organizeOnce()) {
        std::cerr << "One or more films failed to move during processing." << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
