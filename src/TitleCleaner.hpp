#ifndef TITLE_CLEANER_HPP
#define TITLE_CLEANER_HPP

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

// The individual steps that turn a raw file or folder name into a display title.
// FilmParser runs them in order; each one is a pure string transformation.
class TitleCleaner {
public:
    // A compiled "keep these periods" exception and the literal text restored for it.
    using KeptPeriod = std::pair<std::regex, std::string>;

    // True when the name carries a year or a resolution, which marks a release folder.
    static bool isTaggedName(const std::string& name);
    // Use the containing folder's name when it is tagged, otherwise the file name
    // without its extension.
    static std::string chooseSource(const std::string& sourcePath);
    // Remove the first configured prefix the title starts with, ignoring case.
    static std::string stripPrefix(std::string title, const std::vector<std::string>& prefixes);
    // "Matrix, The" becomes "The Matrix".
    static std::string restoreLeadingArticle(const std::string& title);
    // Replace . _ · and brackets with spaces and drop trailing punctuation.
    static std::string replaceTitleCharacters(const std::string& title);
    static std::string removeMatches(const std::string& title, const std::regex& pattern);
    // Keep only the text before the first occurrence of the year.
    static std::string truncateAtYear(std::string title, std::optional<int> year);
    // Build the matcher for an exception such as "S.W.A.T"; it matches the stripped form "S W A T".
    static KeptPeriod compileKeptPeriod(const std::string& keep);
    static std::string restoreKeptPeriods(std::string title, const std::vector<KeptPeriod>& kept);
    static std::string collapseWhitespace(const std::string& title);
};

#endif
