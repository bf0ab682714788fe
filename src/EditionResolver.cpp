#include "EditionResolver.hpp"

#include "Patterns.hpp"

EditionResolver::EditionResolver(const std::vector<EditionAlias>& aliases) {
    m_aliases.reserve(aliases.size());
    for (const auto& [search, replacement] : aliases) {
        // Word boundaries keep short aliases from matching inside longer words.
        m_aliases.push_back({std::regex("\\b(?:" + search + ")\\b", std::regex::ECMAScript | std::regex::icase),
                             replacement});
    }
}

std::optional<EditionMatch> EditionResolver::resolve(const std::string& sourcePath) const {
    return resolveText(patterns::folderAndFile(sourcePath));
}

std::optional<EditionMatch> EditionResolver::resolveText(const std::string& text) const {
    for (const auto& alias : m_aliases) {
        std::smatch match;
        if (std::regex_search(text, match, alias.pattern)) {
            // Substitute into the matched text only, so capture groups carry over.
            const std::string matched = match.str(0);
            return EditionMatch{alias.pattern, std::regex_replace(matched, alias.pattern, alias.replacement)};
        }
    }
    return std::nullopt;
}

std::vector<EditionAlias> EditionResolver::builtInAliases() {
    return {
        {R"(extended[\W_]+director'?s[\W_]+cut)", "Extended Director's Cut"},
        {R"(director'?s[\W_]+cut)", "Director's Cut"},
        {R"((\d{1,3}(?:st|nd|rd|th))[\W_]+anniversary(?:[\W_]+edition)?)", "$1 Anniversary Edition"},
        {R"(special[\W_]+edition)", "Special Edition"},
        {R"(collector'?s[\W_]+edition)", "Collector's Edition"},
        {R"(criterion(?:[\W_]+collection)?)", "Criterion Collection"},
        {R"(ultimate[\W_]+(?:cut|edition))", "Ultimate Edition"},
        {R"(extended(?:[\W_]+(?:cut|edition))?)", "Extended Edition"},
        {R"(final[\W_]+cut)", "Final Cut"},
        {R"(theatrical(?:[\W_]+cut)?)", "Theatrical"},
        {R"(unrated)", "Unrated"},
        {R"(uncut)", "Uncut"},
        {R"(imax)", "IMAX"},
        {R"(remastered)", "Remastered"},
    };
}
