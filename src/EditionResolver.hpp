#ifndef EDITION_RESOLVER_HPP
#define EDITION_RESOLVER_HPP

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

// One entry of the edition table: a search pattern and the canonical text that replaces it.
// The replacement may reference capture groups ($1, $2, ...).
using EditionAlias = std::pair<std::string, std::string>;

// The pattern that matched and the canonical edition text it produced.
struct EditionMatch {
    std::regex pattern;
    std::string edition;
};

// Looks up editions in an ordered alias table; the first entry that matches wins.
class EditionResolver {
public:
    // Compiles every alias; throws std::regex_error when a pattern is invalid.
    explicit EditionResolver(const std::vector<EditionAlias>& aliases);

    // Search the folder and file name of the path for the first matching alias.
    std::optional<EditionMatch> resolve(const std::string& sourcePath) const;
    // Search arbitrary text, without splitting it into folder and file.
    std::optional<EditionMatch> resolveText(const std::string& text) const;

    // Built-in table, more specific editions first.
    static std::vector<EditionAlias> builtInAliases();

private:
    struct CompiledAlias {
        std::regex pattern;
        std::string replacement;
    };

    std::vector<CompiledAlias> m_aliases;
};

#endif
