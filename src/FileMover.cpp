#include "FileMover.hpp"

#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

namespace {
constexpr std::size_t kCopyChunkSize = 1 << 20;

TransferOutcome failed(TransferStatus status) {
    TransferOutcome outcome;
    outcome.status = status;
    return outcome;
}

// Best effort; the caller is already reporting a failure.
void discardStaging(const std::filesystem::path& staging) {
    std::error_code removeErr;
    std::filesystem::remove(staging, removeErr);
    if (removeErr) {
        std::cerr << "Failed to remove staging file `" << staging.string() << "`: " << removeErr.message() << std::endl;
    }
}
} // namespace

SourceNotFoundError::SourceNotFoundError(const std::filesystem::path& source)
    : std::runtime_error("Source file `" + source.string() + "` does not exist"), m_source(source) {}

FileMover::FileMover(TransferPolicy policy)
    : m_policy(policy),
      m_rename([](const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) {
          std::filesystem::rename(from, to, ec);
      }) {}

void FileMover::setPolicy(TransferPolicy policy) {
    m_policy = policy;
}

const TransferPolicy& FileMover::policy() const {
    return m_policy;
}

void FileMover::setProgressCallback(ProgressCallback callback) {
    m_progress = std::move(callback);
}

void FileMover::setRenameFunction(RenameFunction rename) {
    m_rename = std::move(rename);
}

std::filesystem::path FileMover::stagingPathFor(const std::filesystem::path& destination) {
    std::filesystem::path staging = destination;
    staging += kStagingSuffix;
    return staging;
}

TransferOutcome FileMover::safeMove(const std::filesystem::path& sourcePath,
                                    const std::filesystem::path& destinationPath,
                                    bool allowUpgrade) const {
    std::error_code ec;
    const auto sourceStatus = std::filesystem::status(sourcePath, ec);
    if (sourceStatus.type() == std::filesystem::file_type::none) {
        std::cerr << "Unable to inspect `" << sourcePath.string() << "`: " << ec.message() << std::endl;
        return failed(TransferStatus::IOFailure);
    }
    if (!std::filesystem::exists(sourceStatus)) {
        throw SourceNotFoundError(sourcePath);
    }
    if (!std::filesystem::is_regular_file(sourceStatus)) {
        std::cerr << "Cannot transfer `" << sourcePath.string() << "`: not a regular file." << std::endl;
        return failed(TransferStatus::IOFailure);
    }

    if (isSameEntry(sourcePath, destinationPath)) {
        std::cerr << "Source and destination are the same file `" << sourcePath.string() << "`, skipping." << std::endl;
        return failed(TransferStatus::SelfTransferRejected);
    }

    const bool destinationExists = std::filesystem::exists(destinationPath, ec);
    if (ec) {
        std::cerr << "Unable to check destination `" << destinationPath.string() << "`: " << ec.message() << std::endl;
        return failed(TransferStatus::IOFailure);
    }

    DestinationState onSuccess = DestinationState::Created;
    if (destinationExists) {
        if (!std::filesystem::is_regular_file(destinationPath, ec) || ec) {
            std::cerr << "Destination `" << destinationPath.string() << "` exists and is not a regular file." << std::endl;
            return failed(TransferStatus::IOFailure);
        }

        std::error_code sizeErr;
        const auto sourceSize = std::filesystem::file_size(sourcePath, sizeErr);
        const auto destinationSize = sizeErr ? 0 : std::filesystem::file_size(destinationPath, sizeErr);
        if (sizeErr) {
            std::cerr << "Unable to compare sizes of `" << sourcePath.string() << "` and `" << destinationPath.string()
                      << "`: " << sizeErr.message() << std::endl;
            return failed(TransferStatus::IOFailure);
        }

        if (!shouldReplace(sourceSize, destinationSize, allowUpgrade)) {
            std::cout << "Destination `" << destinationPath.string() << "` already exists (" << destinationSize
                      << " bytes, source " << sourceSize << " bytes), leaving both in place." << std::endl;
            return failed(TransferStatus::DuplicatePolicyRejected);
        }
        onSuccess = DestinationState::Replaced;
    }

    if (m_policy.dryRun) {
        std::cout << "[dry run] Would " << (m_policy.alwaysCopy ? "copy" : "move") << " `" << sourcePath.string()
                  << "` -> `" << destinationPath.string() << "`"
                  << (onSuccess == DestinationState::Replaced ? " (replacing existing file)" : "") << std::endl;
        TransferOutcome outcome;
        outcome.success = true;
        outcome.status = TransferStatus::DryRun;
        outcome.destination = onSuccess;
        return outcome;
    }

    if (!ensureParentDirectory(destinationPath)) {
        return failed(TransferStatus::IOFailure);
    }

    if (m_policy.safeCopy || m_policy.alwaysCopy) {
        return stagedCopy(sourcePath, destinationPath, onSuccess, m_policy.alwaysCopy);
    }
    return directMove(sourcePath, destinationPath, onSuccess);
}

bool FileMover::shouldReplace(std::uintmax_t sourceSize, std::uintmax_t destinationSize, bool allowUpgrade) const {
    if (m_policy.forceOverwrite) {
        return true;
    }
    // The caller has already judged the source to be better; a smaller file is expected then.
    if (allowUpgrade && sourceSize < destinationSize) {
        return true;
    }
    return sourceSize > destinationSize;
}

TransferOutcome FileMover::directMove(const std::filesystem::path& sourcePath,
                                      const std::filesystem::path& destinationPath,
                                      DestinationState onSuccess) const {
    // rename replaces an existing destination in one step, so it is never briefly absent.
    std::error_code renameErr;
    m_rename(sourcePath, destinationPath, renameErr);
    if (!renameErr) {
        std::cout << "Moved `" << sourcePath.string() << "` -> `" << destinationPath.string() << "`" << std::endl;
        TransferOutcome outcome;
        outcome.success = true;
        outcome.status = TransferStatus::Moved;
        outcome.sourceRemoved = true;
        outcome.destination = onSuccess;
        return outcome;
    }

    if (renameErr == std::errc::cross_device_link) {
        std::cout << "`" << sourcePath.string() << "` is on another device, copying instead." << std::endl;
        return stagedCopy(sourcePath, destinationPath, onSuccess, false);
    }

    std::cerr << "Failed to move `" << sourcePath.string() << "`: " << renameErr.message() << std::endl;
    return failed(TransferStatus::IOFailure);
}

TransferOutcome FileMover::stagedCopy(const std::filesystem::path& sourcePath,
                                      const std::filesystem::path& destinationPath,
                                      DestinationState onSuccess,
                                      bool keepSource) const {
    const auto staging = stagingPathFor(destinationPath);

    std::error_code ec;
    const auto total = std::filesystem::file_size(sourcePath, ec);
    if (ec) {
        std::cerr << "Unable to read size of `" << sourcePath.string() << "`: " << ec.message() << std::endl;
        return failed(TransferStatus::IOFailure);
    }

    bool copied = false;
    try {
        copied = streamCopy(sourcePath, staging, total);
    } catch (const std::exception& e) {
        std::cerr << "Copy of `" << sourcePath.string() << "` interrupted: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Copy of `" << sourcePath.string() << "` aborted." << std::endl;
        discardStaging(staging);
        throw;
    }
    if (!copied) {
        discardStaging(staging);
        return failed(TransferStatus::IOFailure);
    }

    const auto stagedSize = std::filesystem::file_size(staging, ec);
    if (ec || stagedSize != total) {
        std::cerr << "Copy of `" << sourcePath.string() << "` is incomplete (" << (ec ? 0 : stagedSize) << " of "
                  << total << " bytes)." << std::endl;
        discardStaging(staging);
        return failed(TransferStatus::IOFailure);
    }

    // Metadata is carried over where the target filesystem allows it.
    const auto sourceStatus = std::filesystem::status(sourcePath, ec);
    if (!ec) {
        std::filesystem::permissions(staging, sourceStatus.permissions(), ec);
    }
    if (ec) {
        std::cerr << "Could not copy permissions to `" << staging.string() << "`: " << ec.message() << std::endl;
        ec.clear();
    }
    const auto modified = std::filesystem::last_write_time(sourcePath, ec);
    if (!ec) {
        std::filesystem::last_write_time(staging, modified, ec);
    }
    if (ec) {
        std::cerr << "Could not copy modification time to `" << staging.string() << "`: " << ec.message() << std::endl;
        ec.clear();
    }

    std::filesystem::rename(staging, destinationPath, ec);
    if (ec) {
        std::cerr << "Failed to rename `" << staging.string() << "` -> `" << destinationPath.string()
                  << "`: " << ec.message() << std::endl;
        discardStaging(staging);
        return failed(TransferStatus::IOFailure);
    }

    TransferOutcome outcome;
    outcome.destination = onSuccess;

    if (keepSource) {
        std::cout << "Copied `" << sourcePath.string() << "` -> `" << destinationPath.string() << "`" << std::endl;
        outcome.success = true;
        outcome.status = TransferStatus::Copied;
        return outcome;
    }

    std::filesystem::remove(sourcePath, ec);
    if (ec) {
        std::cerr << "Failed to remove original file `" << sourcePath.string() << "` after copy: " << ec.message()
                  << std::endl;
        outcome.status = TransferStatus::IOFailure;
        return outcome;
    }

    std::cout << "Copied `" << sourcePath.string() << "` -> `" << destinationPath.string() << "` (source removed)"
              << std::endl;
    outcome.success = true;
    outcome.status = TransferStatus::Moved;
    outcome.sourceRemoved = true;
    return outcome;
}

bool FileMover::streamCopy(const std::filesystem::path& sourcePath,
                           const std::filesystem::path& staging,
                           std::uintmax_t total) const {
    std::ifstream in(sourcePath, std::ios::binary);
    if (!in) {
        std::cerr << "Failed to open `" << sourcePath.string() << "` for reading." << std::endl;
        return false;
    }

    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to create staging file `" << staging.string() << "`." << std::endl;
        return false;
    }

    std::vector<char> buffer(kCopyChunkSize);
    std::uintmax_t copied = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = in.gcount();
        if (count <= 0) {
            break;
        }

        out.write(buffer.data(), count);
        if (!out) {
            std::cerr << "Failed writing `" << staging.string() << "` after " << copied << " bytes." << std::endl;
            return false;
        }

        copied += static_cast<std::uintmax_t>(count);
        if (m_progress) {
            m_progress(copied, total);
        }
    }

    if (in.bad()) {
        std::cerr << "Failed reading `" << sourcePath.string() << "` after " << copied << " bytes." << std::endl;
        return false;
    }

    out.close();
    if (!out) {
        std::cerr << "Failed to flush staging file `" << staging.string() << "`." << std::endl;
        return false;
    }
    return true;
}

bool FileMover::isSameEntry(const std::filesystem::path& sourcePath, const std::filesystem::path& destinationPath) {
    std::error_code ec;
    if (std::filesystem::equivalent(sourcePath, destinationPath, ec) && !ec) {
        return true;
    }

    const auto source = std::filesystem::absolute(sourcePath, ec).lexically_normal();
    if (ec) {
        return false;
    }
    const auto destination = std::filesystem::absolute(destinationPath, ec).lexically_normal();
    return !ec && source == destination;
}

bool FileMover::ensureParentDirectory(const std::filesystem::path& destinationPath) {
    const auto parent = destinationPath.parent_path();
    if (parent.empty()) {
        return true;
    }

    std::error_code mkdirErr;
    std::filesystem::create_directories(parent, mkdirErr);
    if (mkdirErr) {
        std::cerr << "Failed to create destination directory `" << parent.string() << "`: " << mkdirErr.message()
                  << std::endl;
        return false;
    }
    return true;
}
