#ifndef ORGANIZER_HPP
#define ORGANIZER_HPP

#include "ConfigParser.hpp"
#include "DestinationFormatter.hpp"
#include "FileMover.hpp"
#include "FilmParser.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

// Walks the source folders and files every recognized film into the library.
class Organizer {
public:
    explicit Organizer(const ConfigParser& config);

    // Scan every source folder once and transfer the films found; returns false if any transfer fails.
    bool organizeOnce();

    // Where a source file belongs, or an empty path when no title could be extracted.
    std::filesystem::path resolveDestinationFor(const std::filesystem::path& file) const;
    bool isVideoFile(const std::filesystem::path& file) const;

    // Normalize extensions (trim whitespace, enforce dot prefix, lower-case).
    static std::string normalizeExtension(std::string extension);

private:
    bool organizeFolder(const std::filesystem::path& sourceFolder);
    bool transfer(const std::filesystem::path& file);

    const ConfigParser& m_config;
    FilmParser m_parser;
    DestinationFormatter m_formatter;
    FileMover m_mover;
    std::unordered_set<std::string> m_extensions;
};

#endif
