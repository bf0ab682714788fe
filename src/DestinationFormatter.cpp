#include "DestinationFormatter.hpp"

#include "Patterns.hpp"
#include "TitleCleaner.hpp"

#include <cctype>
#include <regex>
#include <sstream>
#include <utility>
#include <vector>

namespace {
void replaceAll(std::string& text, const std::string& token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

std::string qualityOf(const FilmAttributes& attributes) {
    const std::string media = toString(attributes.media);
    const std::string resolution = attributes.resolution ? toString(*attributes.resolution) : std::string{};
    if (!media.empty() && !resolution.empty()) {
        return media + "-" + resolution;
    }
    return media.empty() ? resolution : media;
}

// Drop bracket pairs left empty by missing tokens, then tidy the spacing.
std::string cleanSegment(const std::string& segment) {
    static const std::regex emptyBrackets(R"(\(\s*\)|\[\s*\]|\{\s*\})");
    std::string cleaned = std::regex_replace(segment, emptyBrackets, "");
    cleaned = TitleCleaner::collapseWhitespace(cleaned);
    while (!cleaned.empty() && (cleaned.back() == '-' || cleaned.back() == ' ')) {
        cleaned.pop_back();
    }
    return cleaned;
}
} // namespace

DestinationFormatter::DestinationFormatter(std::string pathTemplate) : m_template(std::move(pathTemplate)) {}

std::filesystem::path DestinationFormatter::format(const FilmAttributes& attributes, const std::string& extension) const {
    const std::string title = sanitize(attributes.title);

    // Longer tokens first so "{title}" does not eat the start of "{title-the}".
    const std::vector<std::pair<std::string, std::string>> tokens = {
        {"{title-the}", sortTitle(title)},
        {"{title}", title},
        {"{year}", attributes.year ? std::to_string(*attributes.year) : std::string{}},
        {"{edition}", attributes.edition ? sanitize(*attributes.edition) : std::string{}},
        {"{quality}", qualityOf(attributes)},
        {"{media}", toString(attributes.media)},
        {"{resolution}", attributes.resolution ? toString(*attributes.resolution) : std::string{}},
        {"{hdr}", attributes.isHdr ? "HDR" : ""},
        {"{proper}", attributes.isProper ? "Proper" : ""},
        {"{part}", attributes.part ? "Part " + *attributes.part : std::string{}},
    };

    std::string rendered = m_template;
    for (const auto& [token, value] : tokens) {
        replaceAll(rendered, token, value);
    }

    std::filesystem::path result;
    std::stringstream segments(rendered);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        segment = cleanSegment(segment);
        if (!segment.empty()) {
            result /= segment;
        }
    }

    if (!result.empty() && !extension.empty()) {
        result += (extension.front() == '.' ? extension : "." + extension);
    }
    return result;
}

std::string DestinationFormatter::sortTitle(const std::string& title) {
    std::smatch match;
    if (!std::regex_search(title, match, patterns::articles()) || match.position(0) != 0) {
        return title;
    }

    // Only "The" is moved; TitleCleaner::restoreLeadingArticle undoes exactly this form.
    std::string article = TitleCleaner::collapseWhitespace(match.str(0));
    if (article.size() != 3 || std::tolower(static_cast<unsigned char>(article[0])) != 't') {
        return title;
    }
    return match.suffix().str() + ", The";
}

std::string DestinationFormatter::sanitize(const std::string& text) {
    const auto illegal = patterns::illegalCharacters();
    std::string sanitized;
    sanitized.reserve(text.size());
    for (char ch : text) {
        if (ch == '/' || illegal.find(ch) != std::string_view::npos) {
            continue;
        }
        sanitized.push_back(ch);
    }
    return TitleCleaner::collapseWhitespace(sanitized);
}
