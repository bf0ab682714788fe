#include "FilmParser.hpp"

#include "Patterns.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

FilmParser::FilmParser(ParserConfig config)
    : m_config(std::move(config)), m_editions(m_config.editionAliases) {
    for (const auto& keep : m_config.keepPeriod) {
        // An exception made only of periods would match between every pair of characters.
        if (keep.find_first_not_of('.') == std::string::npos) {
            continue;
        }
        m_keptPeriods.push_back(TitleCleaner::compileKeptPeriod(keep));
    }
}

FilmAttributes FilmParser::extract(const std::string& sourcePath) const {
    FilmAttributes attributes;
    attributes.title = extractTitle(sourcePath);
    attributes.year = extractYear(sourcePath);
    attributes.resolution = extractResolution(sourcePath);
    attributes.media = extractMedia(sourcePath);
    attributes.edition = extractEdition(sourcePath);
    attributes.part = extractPart(sourcePath);
    attributes.isHdr = isHdr(sourcePath);
    attributes.isProper = isProper(sourcePath);
    return attributes;
}

std::string FilmParser::extractTitle(const std::string& sourcePath) const {
    std::string title = TitleCleaner::chooseSource(sourcePath);
    title = TitleCleaner::stripPrefix(std::move(title), m_config.stripPrefixes);
    title = TitleCleaner::restoreLeadingArticle(title);
    title = TitleCleaner::replaceTitleCharacters(title);

    // The edition is reported on its own; don't repeat it in the title.
    if (const auto edition = resolveEditionMatch(sourcePath)) {
        title = TitleCleaner::removeMatches(title, edition->pattern);
    }

    title = TitleCleaner::removeMatches(title, patterns::media());
    title = TitleCleaner::removeMatches(title, patterns::resolution());
    title = TitleCleaner::truncateAtYear(std::move(title), extractYear(sourcePath));
    title = TitleCleaner::restoreKeptPeriods(std::move(title), m_keptPeriods);
    return TitleCleaner::collapseWhitespace(title);
}

std::optional<int> FilmParser::extractYear(const std::string& sourcePath) {
    const std::string text = patterns::folderAndFile(sourcePath);

    std::optional<int> year;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), patterns::year()); it != std::sregex_iterator(); ++it) {
        year = std::stoi((*it)[1].str());
    }
    return year;
}

std::optional<std::string> FilmParser::extractEdition(const std::string& sourcePath) const {
    if (auto match = resolveEditionMatch(sourcePath)) {
        return std::move(match->edition);
    }
    return std::nullopt;
}

std::optional<EditionMatch> FilmParser::resolveEditionMatch(const std::string& sourcePath) const {
    return m_editions.resolve(sourcePath);
}

std::optional<Resolution> FilmParser::extractResolution(const std::string& sourcePath) {
    const std::string text = patterns::folderAndFile(sourcePath);
    std::smatch match;
    if (!std::regex_search(text, match, patterns::resolution())) {
        return std::nullopt;
    }

    std::string value = match.str(1);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (value == "4k" || value.rfind("2160", 0) == 0) {
        return Resolution::R2160p;
    }
    if (value.rfind("1080", 0) == 0) {
        return Resolution::R1080p;
    }
    return Resolution::R720p;
}

Media FilmParser::extractMedia(const std::string& sourcePath) {
    const std::string text = patterns::folderAndFile(sourcePath);
    std::smatch match;
    if (!std::regex_search(text, match, patterns::media())) {
        return Media::Unknown;
    }

    static constexpr Media kByGroup[] = {Media::Bluray, Media::WebDl, Media::Hdtv, Media::Dvd, Media::Sdtv};
    for (std::size_t group = 0; group < std::size(kByGroup); ++group) {
        if (match[group + 1].matched) {
            return kByGroup[group];
        }
    }
    return Media::Unknown;
}

bool FilmParser::isHdr(const std::string& sourcePath) {
    return std::regex_search(patterns::folderAndFile(sourcePath), patterns::hdr());
}

bool FilmParser::isProper(const std::string& sourcePath) {
    return std::regex_search(patterns::folderAndFile(sourcePath), patterns::proper());
}

std::optional<std::string> FilmParser::extractPart(const std::string& sourcePath) {
    const std::string text = patterns::folderAndFile(sourcePath);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), patterns::part()); it != std::sregex_iterator(); ++it) {
        std::string part = (*it)[1].str();
        if (part.empty()) {
            continue;
        }
        std::transform(part.begin(), part.end(), part.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });
        return part;
    }
    return std::nullopt;
}
