#undef NDEBUG
#include "EditionResolver.hpp"

#include <cassert>
#include <iostream>
#include <regex>
#include <string>
#include <vector>

namespace {

void TestFirstMatchingAliasWins() {
    const std::vector<EditionAlias> broadAliases = {
        {"extended", "Extended"},
        {R"(extended[\W_]+director'?s[\W_]+cut)", "Extended Director's Cut"},
    };
    const EditionResolver broadFirst(broadAliases);
    const auto broad = broadFirst.resolve("/films/Apocalypse.Now.1979.Extended.Directors.Cut.mkv");
    assert(broad && broad->edition == "Extended");

    const std::vector<EditionAlias> specificAliases = {broadAliases[1], broadAliases[0]};
    const EditionResolver specificFirst(specificAliases);
    const auto specific = specificFirst.resolve("/films/Apocalypse.Now.1979.Extended.Directors.Cut.mkv");
    assert(specific && specific->edition == "Extended Director's Cut");
}

void TestNoMatchYieldsNothing() {
    const EditionResolver resolver(EditionResolver::builtInAliases());
    assert(!resolver.resolve("/films/Heat.1995.1080p.BluRay.mkv"));
    assert(!EditionResolver(std::vector<EditionAlias>{}).resolve("/films/Blade.Runner.Final.Cut.mkv"));
}

void TestAliasesMatchWholeWordsOnly() {
    const EditionResolver resolver(EditionResolver::builtInAliases());
    assert(!resolver.resolve("/films/Uncutting.Gems.2019.mkv"));
    assert(resolver.resolve("/films/Movie.2011.Uncut.mkv")->edition == "Uncut");
}

void TestCaptureGroupsAreSubstituted() {
    const EditionResolver resolver(EditionResolver::builtInAliases());
    const auto match = resolver.resolve("/films/Jaws.1975.25th.Anniversary.Edition.1080p.mkv");
    assert(match && match->edition == "25th Anniversary Edition");
}

void TestMatchedPatternRemovesEditionText() {
    const EditionResolver resolver(EditionResolver::builtInAliases());
    const auto match = resolver.resolveText("Amadeus Directors Cut 1984");
    assert(match && match->edition == "Director's Cut");
    assert(std::regex_replace(std::string("Amadeus Directors Cut 1984"), match->pattern, "") == "Amadeus  1984");
}

void TestEditionInFolderName() {
    const EditionResolver resolver(EditionResolver::builtInAliases());
    const auto match = resolver.resolve("/films/Aliens (1986) Special Edition/aliens.mkv");
    assert(match && match->edition == "Special Edition");
    // Only the immediate folder is searched.
    assert(!resolver.resolve("/Special Edition/films/aliens.mkv"));
}

void TestInvalidPatternThrows() {
    bool threw = false;
    try {
        const std::vector<EditionAlias> aliases = {{"director's(cut", "Director's Cut"}};
        EditionResolver resolver(aliases);
        (void)resolver;
    } catch (const std::regex_error&) {
        threw = true;
    }
    assert(threw && "EditionResolver must reject patterns that do not compile.");
}

} // namespace

int main() {
    TestFirstMatchingAliasWins();
    TestNoMatchYieldsNothing();
    TestAliasesMatchWholeWordsOnly();
    TestCaptureGroupsAreSubstituted();
    TestMatchedPatternRemovesEditionText();
    TestEditionInFolderName();
    TestInvalidPatternThrows();

    std::cout << "filmjanitor_edition_resolver: pass\n";
    return 0;
}
