#include "ConfigParser.hpp"

#include "DestinationFormatter.hpp"
#include "EditionResolver.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
const std::vector<std::string> kDefaultVideoExtensions = {".mkv", ".mp4", ".m4v", ".avi", ".mov", ".wmv", ".ts"};

// Read an optional boolean member; a present value of any other type is an error.
bool readBool(const json& object, const std::string& key, bool& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        std::cerr << "`" << key << "` must be a boolean value." << std::endl;
        return false;
    }
    out = it->get<bool>();
    return true;
}
} // namespace

const std::vector<std::filesystem::path>& ConfigParser::getSourceFolders() const {
    return m_source_folders;
}

std::filesystem::path ConfigParser::getDestinationFor(std::optional<Resolution> resolution) const {
    if (resolution) {
        auto it = m_destinations.byResolution.find(toString(*resolution));
        if (it != m_destinations.byResolution.end()) {
            return it->second;
        }
    }
    return m_destinations.fallback;
}

const std::vector<std::string>& ConfigParser::getVideoExtensions() const {
    return m_video_extensions;
}

const ParserConfig& ConfigParser::getParserConfig() const {
    return m_parser_config;
}

const TransferPolicy& ConfigParser::getTransferPolicy() const {
    return m_policy;
}

const std::string& ConfigParser::getDestinationTemplate() const {
    return m_destination_template;
}

bool ConfigParser::load(const std::string& configRoot) {
    // films.json lives in a config folder under the config root.
    std::filesystem::path configDir = std::filesystem::path(configRoot) / "config";
    std::filesystem::path configPath = configDir / "films.json";

    std::ifstream jsonFile(configPath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << configPath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    return loadFromJson(data, configPath.string());
}

bool ConfigParser::loadFromJson(const json& data, const std::string& origin) {
    if (!data.is_object()) {
        std::cerr << "Configuration `" << origin << "` must be a JSON object." << std::endl;
        return false;
    }

    loadPlaceholders(data);

    m_source_folders.clear();
    m_video_extensions.clear();
    m_parser_config = ParserConfig{};
    m_policy = TransferPolicy{};
    m_destination_template = DestinationFormatter::kDefaultTemplate;

    try {
        const json& sources = data.at("source_folders");
        if (!sources.is_array()) {
            std::cerr << "`source_folders` must be an array." << std::endl;
            return false;
        }
        for (const auto& source : sources) {
            if (!source.is_string()) {
                std::cerr << "Each entry in `source_folders` must be a string." << std::endl;
                return false;
            }
            const std::string folder = applyPlaceholders(source.get<std::string>());
            if (folder.empty()) {
                std::cerr << "Entries in `source_folders` cannot be empty." << std::endl;
                return false;
            }
            m_source_folders.emplace_back(folder);
        }
    } catch (const json::exception& e) {
        std::cerr << "Missing or invalid source_folders: " << e.what() << std::endl;
        return false;
    }

    if (m_source_folders.empty()) {
        std::cerr << "No source folders configured; nothing will be organized." << std::endl;
    }

    if (!parseDestinations(data)) {
        return false;
    }

    if (data.contains("video_extensions")) {
        if (!parseStringArray(data, "video_extensions", m_video_extensions)) {
            return false;
        }
    } else {
        m_video_extensions = kDefaultVideoExtensions;
    }

    if (!parseStringArray(data, "strip_prefixes", m_parser_config.stripPrefixes) ||
        !parseStringArray(data, "keep_period", m_parser_config.keepPeriod)) {
        return false;
    }

    if (!parseEditionMap(data) || !parseTransferPolicy(data)) {
        return false;
    }

    if (auto it = data.find("destination_template"); it != data.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            std::cerr << "`destination_template` must be a non-empty string." << std::endl;
            return false;
        }
        m_destination_template = it->get<std::string>();
    }

    std::cout << "Loaded " << m_source_folders.size() << " source folder(s) and "
              << m_parser_config.editionAliases.size() << " edition alias(es) from " << origin << std::endl;
    return true;
}

bool ConfigParser::parseStringArray(const json& data, const std::string& key, std::vector<std::string>& out) const {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }
    if (!it->is_array()) {
        std::cerr << "Invalid configuration: `" << key << "` must be an array." << std::endl;
        return false;
    }

    out.clear();
    for (const auto& entry : *it) {
        if (!entry.is_string()) {
            std::cerr << "Invalid configuration: each entry in `" << key << "` must be a string." << std::endl;
            return false;
        }
        out.push_back(entry.get<std::string>());
    }
    return true;
}

bool ConfigParser::parseDestinations(const json& data) {
    m_destinations = DestinationFolders{};

    auto it = data.find("destination_folders");
    if (it == data.end() || !it->is_object()) {
        std::cerr << "Missing or invalid `destination_folders`: expected an object." << std::endl;
        return false;
    }

    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        if (!entry.value().is_string()) {
            std::cerr << "Destination folder `" << entry.key() << "` must be a string." << std::endl;
            return false;
        }

        const std::string folder = applyPlaceholders(entry.value().get<std::string>());
        if (folder.empty()) {
            std::cerr << "Destination folder `" << entry.key() << "` cannot be empty." << std::endl;
            return false;
        }

        if (entry.key() == "default") {
            m_destinations.fallback = folder;
        } else if (entry.key() == "720p" || entry.key() == "1080p" || entry.key() == "2160p") {
            m_destinations.byResolution[entry.key()] = folder;
        } else {
            std::cerr << "Unknown destination folder key `" << entry.key()
                      << "`; expected 720p, 1080p, 2160p or default." << std::endl;
            return false;
        }
    }

    if (m_destinations.fallback.empty()) {
        std::cerr << "`destination_folders` must define a `default` folder." << std::endl;
        return false;
    }
    return true;
}

bool ConfigParser::parseEditionMap(const json& data) {
    bool useDefaultEditions = true;
    if (!readBool(data, "use_default_editions", useDefaultEditions)) {
        return false;
    }

    std::vector<EditionAlias> aliases;
    if (auto it = data.find("edition_map"); it != data.end()) {
        if (!it->is_array()) {
            std::cerr << "Invalid configuration: `edition_map` must be an array." << std::endl;
            return false;
        }
        for (const auto& entry : *it) {
            if (!entry.is_array() || entry.size() != 2 || !entry[0].is_string() || !entry[1].is_string()) {
                std::cerr << "Invalid `edition_map` entry " << entry.dump()
                          << ": expected [\"pattern\", \"replacement\"]." << std::endl;
                return false;
            }
            aliases.emplace_back(entry[0].get<std::string>(), entry[1].get<std::string>());
        }
    }

    if (useDefaultEditions) {
        const auto defaults = EditionResolver::builtInAliases();
        aliases.insert(aliases.end(), defaults.begin(), defaults.end());
    }

    // Compile once here so a bad pattern is reported at load time instead of on first use.
    try {
        EditionResolver validated(aliases);
        (void)validated;
    } catch (const std::regex_error& e) {
        std::cerr << "Invalid pattern in `edition_map`: " << e.what() << std::endl;
        return false;
    }

    m_parser_config.editionAliases = std::move(aliases);
    return true;
}

bool ConfigParser::parseTransferPolicy(const json& data) {
    if (auto it = data.find("duplicates"); it != data.end()) {
        if (!it->is_object()) {
            std::cerr << "`duplicates` must be an object." << std::endl;
            return false;
        }
        if (!readBool(*it, "force_overwrite", m_policy.forceOverwrite)) {
            return false;
        }
    }

    return readBool(data, "safe_copy", m_policy.safeCopy) && readBool(data, "always_copy", m_policy.alwaysCopy) &&
           readBool(data, "dry_run", m_policy.dryRun);
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    // Support both legacy `user` token and the newer `placeholders` map.
    auto addPlaceholder = [this](const std::string& key, const json& value) {
        if (!value.is_string()) {
            std::cerr << "Placeholder `" << key << "` must be a string." << std::endl;
            return;
        }
        m_placeholders[key] = value.get<std::string>();
    };

    if (auto userIt = data.find("user"); userIt != data.end()) {
        addPlaceholder("user", *userIt);
    }

    if (auto placeholdersIt = data.find("placeholders"); placeholdersIt != data.end()) {
        if (!placeholdersIt->is_object()) {
            std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        } else {
            for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
                addPlaceholder(it.key(), it.value());
            }
        }
    }
}

std::string ConfigParser::applyPlaceholders(const std::string& value) const {
    std::string result = value;
    for (const auto& [key, replacement] : m_placeholders) {
        const std::string token = "{{" + key + "}}";
        std::size_t pos = 0;
        // Replace all occurrences instead of just the first to allow repeated tokens.
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }

    if (result.find("{{") != std::string::npos) {
        std::cerr << "Warning: unresolved placeholder detected in value `" << result << "`." << std::endl;
    }

    return result;
}
