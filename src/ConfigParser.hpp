#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "FileMover.hpp"
#include "FilmAttributes.hpp"
#include "FilmParser.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Library roots per resolution; films with no known resolution go to the fallback.
struct DestinationFolders {
    std::filesystem::path fallback;
    std::unordered_map<std::string, std::filesystem::path> byResolution;
};

// Parses config/films.json and exposes the folders, parser tables and transfer policy.
class ConfigParser {
public:
    // Load configuration from <configRoot>/config/films.json; returns false on I/O or validation errors.
    bool load(const std::string& configRoot);
    // Parse an already-read document. `origin` names it in diagnostics.
    bool loadFromJson(const nlohmann::json& data, const std::string& origin);

    const std::vector<std::filesystem::path>& getSourceFolders() const;
    // Root folder that films of the given resolution are filed under.
    std::filesystem::path getDestinationFor(std::optional<Resolution> resolution) const;
    const std::vector<std::string>& getVideoExtensions() const;
    const ParserConfig& getParserConfig() const;
    const TransferPolicy& getTransferPolicy() const;
    const std::string& getDestinationTemplate() const;

private:
    // Collect placeholder tokens (built-in and user-defined) for later substitution.
    void loadPlaceholders(const nlohmann::json& data);
    // Replace placeholder tokens in strings, logging warnings for unresolved entries.
    std::string applyPlaceholders(const std::string& value) const;
    // Read an optional array of strings, keeping its order.
    bool parseStringArray(const nlohmann::json& data, const std::string& key, std::vector<std::string>& out) const;
    bool parseDestinations(const nlohmann::json& data);
    // Custom entries first so they win over the built-in table.
    bool parseEditionMap(const nlohmann::json& data);
    bool parseTransferPolicy(const nlohmann::json& data);

    std::vector<std::filesystem::path> m_source_folders;
    DestinationFolders m_destinations;
    std::vector<std::string> m_video_extensions;
    ParserConfig m_parser_config;
    TransferPolicy m_policy;
    std::string m_destination_template;
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
