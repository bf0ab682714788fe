#ifndef FILM_PARSER_HPP
#define FILM_PARSER_HPP

#include "EditionResolver.hpp"
#include "FilmAttributes.hpp"
#include "TitleCleaner.hpp"

#include <optional>
#include <string>
#include <vector>

// Tables that tune title extraction. All lists are ordered; the first match wins.
struct ParserConfig {
    std::vector<std::string> stripPrefixes;
    std::vector<std::string> keepPeriod;
    std::vector<EditionAlias> editionAliases = EditionResolver::builtInAliases();
};

// Extracts film attributes from a file path. Every query is independent and depends only on
// the path string; a parser holds no mutable state, so one instance can serve many threads.
class FilmParser {
public:
    // Throws std::regex_error when an edition alias does not compile.
    explicit FilmParser(ParserConfig config = {});

    // Run every query and collect the results.
    FilmAttributes extract(const std::string& sourcePath) const;

    std::string extractTitle(const std::string& sourcePath) const;
    // Right-most year in the folder and file name.
    static std::optional<int> extractYear(const std::string& sourcePath);
    std::optional<std::string> extractEdition(const std::string& sourcePath) const;
    std::optional<EditionMatch> resolveEditionMatch(const std::string& sourcePath) const;
    static std::optional<Resolution> extractResolution(const std::string& sourcePath);
    static Media extractMedia(const std::string& sourcePath);
    static bool isHdr(const std::string& sourcePath);
    static bool isProper(const std::string& sourcePath);
    // Part number, upper-cased ("2", "II"), if any.
    static std::optional<std::string> extractPart(const std::string& sourcePath);

private:
    ParserConfig m_config;
    EditionResolver m_editions;
    std::vector<TitleCleaner::KeptPeriod> m_keptPeriods;
};

#endif
