#include "TitleCleaner.hpp"

#include "Patterns.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace {
bool startsWithIgnoringCase(const std::string& text, const std::string& prefix) {
    if (prefix.size() > text.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}
} // namespace

bool TitleCleaner::isTaggedName(const std::string& name) {
    // Searched the same way a bare name is searched from a path: after a separator.
    const std::string text = "/" + name;
    return std::regex_search(text, patterns::year()) || std::regex_search(text, patterns::resolution());
}

std::string TitleCleaner::chooseSource(const std::string& sourcePath) {
    const std::filesystem::path path(sourcePath);
    const std::string folder = path.parent_path().filename().string();
    if (!folder.empty() && isTaggedName(folder)) {
        return folder;
    }
    return path.stem().string();
}

std::string TitleCleaner::stripPrefix(std::string title, const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (!prefix.empty() && startsWithIgnoringCase(title, prefix)) {
            title.erase(0, prefix.size());
            break;
        }
    }
    return title;
}

std::string TitleCleaner::restoreLeadingArticle(const std::string& title) {
    static const std::regex suffix(R"(, the\b)", std::regex::ECMAScript | std::regex::icase);
    if (!std::regex_search(title, suffix)) {
        return title;
    }
    return "The " + std::regex_replace(title, suffix, "");
}

std::string TitleCleaner::replaceTitleCharacters(const std::string& title) {
    return patterns::stripTrailingNonWord(std::regex_replace(title, patterns::titleCharacters(), " "));
}

std::string TitleCleaner::removeMatches(const std::string& title, const std::regex& pattern) {
    return std::regex_replace(title, pattern, "");
}

std::string TitleCleaner::truncateAtYear(std::string title, std::optional<int> year) {
    if (!year) {
        return title;
    }
    const auto pos = title.find(std::to_string(*year));
    if (pos != std::string::npos) {
        title.erase(pos);
    }
    return title;
}

TitleCleaner::KeptPeriod TitleCleaner::compileKeptPeriod(const std::string& keep) {
    std::string pattern;
    std::stringstream pieces(keep);
    std::string piece;
    while (std::getline(pieces, piece, '.')) {
        if (piece.empty()) {
            continue;
        }
        if (!pattern.empty()) {
            pattern += R"([\s.]+)";
        }
        pattern += patterns::escape(piece);
    }

    // '$' is special in a replacement format.
    std::string replacement;
    for (char ch : keep) {
        if (ch == '$') {
            replacement.push_back('$');
        }
        replacement.push_back(ch);
    }

    return {std::regex("\\b" + pattern + "\\b", std::regex::ECMAScript | std::regex::icase), replacement};
}

std::string TitleCleaner::restoreKeptPeriods(std::string title, const std::vector<KeptPeriod>& kept) {
    for (const auto& [pattern, replacement] : kept) {
        title = std::regex_replace(title, pattern, replacement);
    }
    return title;
}

std::string TitleCleaner::collapseWhitespace(const std::string& title) {
    std::istringstream words(title);
    std::string word;
    std::string collapsed;
    while (words >> word) {
        if (!collapsed.empty()) {
            collapsed.push_back(' ');
        }
        collapsed += word;
    }
    return collapsed;
}
