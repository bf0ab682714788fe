#include "Organizer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>

Organizer::Organizer(const ConfigParser& config)
    : m_config(config),
      m_parser(config.getParserConfig()),
      m_formatter(config.getDestinationTemplate()),
      m_mover(config.getTransferPolicy()) {
    for (const auto& ext : config.getVideoExtensions()) {
        std::string normalized = normalizeExtension(ext);
        if (!normalized.empty()) {
            m_extensions.insert(std::move(normalized));
        }
    }
}

bool Organizer::organizeOnce() {
    bool allSucceeded = true;
    for (const auto& folder : m_config.getSourceFolders()) {
        if (!organizeFolder(folder)) {
            allSucceeded = false;
        }
    }
    return allSucceeded;
}

bool Organizer::organizeFolder(const std::filesystem::path& sourceFolder) {
    std::error_code ec;
    if (!std::filesystem::is_directory(sourceFolder, ec) || ec) {
        std::cerr << "Source folder `" << sourceFolder.string() << "` is not accessible: "
                  << (ec ? ec.message() : "not a directory") << std::endl;
        return false;
    }

    // Collect first; moving files while iterating would invalidate the walk.
    std::vector<std::filesystem::path> films;
    std::filesystem::recursive_directory_iterator iter(
        sourceFolder, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << sourceFolder.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    for (auto end = std::filesystem::recursive_directory_iterator(); iter != end; iter.increment(ec)) {
        if (ec) {
            std::cerr << "Error while scanning `" << sourceFolder.string() << "`: " << ec.message() << std::endl;
            return false;
        }

        std::error_code typeErr;
        if (!iter->is_regular_file(typeErr) || typeErr) {
            continue;
        }
        if (isVideoFile(iter->path())) {
            films.push_back(iter->path());
        }
    }

    std::sort(films.begin(), films.end());

    bool allSucceeded = true;
    for (const auto& film : films) {
        if (!transfer(film)) {
            allSucceeded = false;
        }
    }
    return allSucceeded;
}

bool Organizer::transfer(const std::filesystem::path& file) {
    const auto destination = resolveDestinationFor(file);
    if (destination.empty()) {
        std::cout << "Could not determine a title for `" << file.filename().string() << "`, leaving in place." << std::endl;
        return true;
    }

    try {
        const TransferOutcome outcome = m_mover.safeMove(file, destination);
        // A duplicate that policy keeps is a decision, not a failure of the run.
        return outcome.success || outcome.status == TransferStatus::DuplicatePolicyRejected ||
               outcome.status == TransferStatus::SelfTransferRejected;
    } catch (const SourceNotFoundError& e) {
        std::cerr << e.what() << std::endl;
        return false;
    }
}

std::filesystem::path Organizer::resolveDestinationFor(const std::filesystem::path& file) const {
    const FilmAttributes attributes = m_parser.extract(file.string());
    if (attributes.title.empty()) {
        return {};
    }

    const auto relative = m_formatter.format(attributes, normalizeExtension(file.extension().string()));
    if (relative.empty()) {
        return {};
    }
    return m_config.getDestinationFor(attributes.resolution) / relative;
}

bool Organizer::isVideoFile(const std::filesystem::path& file) const {
    const std::string name = file.filename().string();
    const std::string suffix = FileMover::kStagingSuffix;
    // Staging files belong to a transfer still in progress.
    if (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return false;
    }

    std::string extension = file.has_extension() ? normalizeExtension(file.extension().string()) : std::string{};
    return !extension.empty() && m_extensions.count(extension) > 0;
}

std::string Organizer::normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}
