#undef NDEBUG
#include "ConfigParser.hpp"
#include "DestinationFormatter.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using json = nlohmann::json;

std::filesystem::path WriteConfig(const std::string& testName, const std::string& content) {
    const auto root = std::filesystem::temp_directory_path() / "filmjanitor_config_parser_tests" / testName;
    std::filesystem::create_directories(root / "config");

    std::ofstream out(root / "config" / "films.json");
    out << content;
    out.close();

    return root;
}

json MinimalConfig() {
    return json{
        {"source_folders", json::array({"/downloads"})},
        {"destination_folders", {{"default", "/library/SD"}}},
    };
}

void TestLoadsFullConfiguration() {
    const auto root = WriteConfig("full", R"({
        "user": "ana",
        "placeholders": {"mnt": "/mnt"},
        "source_folders": ["/home/ana/Downloads", "{{mnt}}/{{user}}/incoming"],
        "destination_folders": {
            "1080p": "/library/HD",
            "2160p": "/library/4K",
            "default": "/library/SD"
        },
        "video_extensions": ["MKV", " mp4 "],
        "strip_prefixes": ["[ www.Speed.Cd ] - "],
        "keep_period": ["S.W.A.T"],
        "edition_map": [["alternate[\\W_]+ending", "Alternate Ending"]],
        "duplicates": {"force_overwrite": true},
        "safe_copy": true,
        "dry_run": true,
        "destination_template": "{title} ({year})/{title} {quality}"
    })");

    ConfigParser parser;
    assert(parser.load(root.string()));

    assert(parser.getSourceFolders().size() == 2);
    assert(parser.getSourceFolders()[1] == std::filesystem::path("/mnt/ana/incoming"));
    assert(parser.getDestinationFor(Resolution::R1080p) == std::filesystem::path("/library/HD"));
    assert(parser.getDestinationFor(Resolution::R2160p) == std::filesystem::path("/library/4K"));
    assert(parser.getDestinationFor(Resolution::R720p) == std::filesystem::path("/library/SD"));
    assert(parser.getDestinationFor(std::nullopt) == std::filesystem::path("/library/SD"));
    assert(parser.getVideoExtensions().size() == 2);

    const ParserConfig& parserConfig = parser.getParserConfig();
    assert(parserConfig.stripPrefixes.size() == 1);
    assert(parserConfig.keepPeriod.front() == "S.W.A.T");
    // Custom aliases come before the built-in table.
    assert(parserConfig.editionAliases.front().second == "Alternate Ending");
    assert(parserConfig.editionAliases.size() == EditionResolver::builtInAliases().size() + 1);

    const TransferPolicy& policy = parser.getTransferPolicy();
    assert(policy.forceOverwrite);
    assert(policy.safeCopy);
    assert(!policy.alwaysCopy);
    assert(policy.dryRun);
    assert(parser.getDestinationTemplate() == "{title} ({year})/{title} {quality}");
}

void TestDefaultsApplyWhenKeysAreMissing() {
    ConfigParser parser;
    assert(parser.loadFromJson(MinimalConfig(), "minimal"));

    assert(parser.getVideoExtensions().size() == 7);
    assert(parser.getParserConfig().stripPrefixes.empty());
    assert(parser.getParserConfig().editionAliases.size() == EditionResolver::builtInAliases().size());
    assert(!parser.getTransferPolicy().forceOverwrite);
    assert(!parser.getTransferPolicy().dryRun);
    assert(parser.getDestinationTemplate() == DestinationFormatter::kDefaultTemplate);
}

void TestBuiltInEditionsCanBeDisabled() {
    json config = MinimalConfig();
    config["use_default_editions"] = false;
    config["edition_map"] = json::array({json::array({"imax", "IMAX Enhanced"})});

    ConfigParser parser;
    assert(parser.loadFromJson(config, "no_default_editions"));
    assert(parser.getParserConfig().editionAliases.size() == 1);
}

void TestInvalidConfigurationsAreRejected() {
    ConfigParser parser;

    json noDefault = MinimalConfig();
    noDefault["destination_folders"] = {{"1080p", "/library/HD"}};
    assert(!parser.loadFromJson(noDefault, "no_default"));

    json unknownResolution = MinimalConfig();
    unknownResolution["destination_folders"]["480p"] = "/library/old";
    assert(!parser.loadFromJson(unknownResolution, "unknown_resolution"));

    json badPattern = MinimalConfig();
    badPattern["edition_map"] = json::array({json::array({"director's(cut", "Director's Cut"})});
    assert(!parser.loadFromJson(badPattern, "bad_pattern"));

    json badEntry = MinimalConfig();
    badEntry["edition_map"] = json::array({json::array({"imax"})});
    assert(!parser.loadFromJson(badEntry, "bad_entry"));

    json badFlag = MinimalConfig();
    badFlag["safe_copy"] = "yes";
    assert(!parser.loadFromJson(badFlag, "bad_flag"));

    json missingSources = MinimalConfig();
    missingSources.erase("source_folders");
    assert(!parser.loadFromJson(missingSources, "missing_sources"));

    assert(!parser.loadFromJson(json::array(), "not_an_object"));
}

void TestMissingOrMalformedFileFails() {
    ConfigParser parser;
    assert(!parser.load((std::filesystem::temp_directory_path() / "filmjanitor_no_such_root").string()));

    const auto root = WriteConfig("malformed", "{ \"source_folders\": [");
    assert(!parser.load(root.string()));
}

} // namespace

int main() {
    TestLoadsFullConfiguration();
    TestDefaultsApplyWhenKeysAreMissing();
    TestBuiltInEditionsCanBeDisabled();
    TestInvalidConfigurationsAreRejected();
    TestMissingOrMalformedFileFails();

    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "filmjanitor_config_parser_tests");
    std::cout << "filmjanitor_config_parser: pass\n";
    return 0;
}
