#ifndef DESTINATION_FORMATTER_HPP
#define DESTINATION_FORMATTER_HPP

#include "FilmAttributes.hpp"

#include <filesystem>
#include <string>

// Renders film attributes into a library-relative path from a template such as
// "{title} ({year})/{title} ({year}) {quality}". Tokens without a value render empty and the
// leftovers (empty brackets, doubled spaces) are cleaned up.
class DestinationFormatter {
public:
    static constexpr const char* kDefaultTemplate =
        "{title} ({year})/{title} ({year}) {edition} {quality} {hdr} {proper} {part}";

    explicit DestinationFormatter(std::string pathTemplate = kDefaultTemplate);

    std::filesystem::path format(const FilmAttributes& attributes, const std::string& extension) const;

    // "The Matrix" becomes "Matrix, The" so titles sort without their article.
    static std::string sortTitle(const std::string& title);
    // Remove characters the filesystem will not accept in a single path segment.
    static std::string sanitize(const std::string& text);

private:
    std::string m_template;
};

#endif
