#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>

// How the mover treats existing destinations and how it transfers bytes.
struct TransferPolicy {
    // Replace an existing destination regardless of size.
    bool forceOverwrite = false;
    // Always copy through a staging file, even when a rename would do.
    bool safeCopy = false;
    // Copy through a staging file and keep the source.
    bool alwaysCopy = false;
    // Evaluate and report, but never touch the filesystem.
    bool dryRun = false;
};

enum class TransferStatus {
    Moved,
    Copied,
    DryRun,
    SelfTransferRejected,
    DuplicatePolicyRejected,
    IOFailure
};

enum class DestinationState {
    Created,
    Replaced,
    Unchanged
};

// Result of one transfer. In dry-run mode `destination` describes what would have happened.
// An IOFailure normally leaves the destination Unchanged. The exception is a staged copy that
// landed but whose source could not be removed: `destination` is then Created or Replaced and
// `sourceRemoved` is false, so the source is left as a duplicate.
struct TransferOutcome {
    bool success = false;
    TransferStatus status = TransferStatus::IOFailure;
    bool sourceRemoved = false;
    DestinationState destination = DestinationState::Unchanged;

    explicit operator bool() const { return success; }
};

// Raised when the file to transfer is not on disk. Nothing has been modified.
class SourceNotFoundError : public std::runtime_error {
public:
    explicit SourceNotFoundError(const std::filesystem::path& source);

    const std::filesystem::path& source() const { return m_source; }

private:
    std::filesystem::path m_source;
};

// Moves or copies a single file to its final location. The destination never holds a
// partially written file: copies land in "<destination>.partial~" and are renamed into place
// once complete.
class FileMover {
public:
    // Called after every chunk of a staged copy with the bytes copied so far and the total.
    // Throwing from the callback aborts the copy. A std::exception is reported as IOFailure;
    // anything else is rethrown once the staging file is gone.
    using ProgressCallback = std::function<void(std::uintmax_t copied, std::uintmax_t total)>;
    // Performs the in-place rename of a direct move, reporting errors through the error_code.
    using RenameFunction =
        std::function<void(const std::filesystem::path&, const std::filesystem::path&, std::error_code&)>;

    static constexpr const char* kStagingSuffix = ".partial~";

    explicit FileMover(TransferPolicy policy = {});

    // Transfer source to destination. allowUpgrade tells the mover the source is known to be a
    // better copy than an existing destination, so it may replace it even when smaller.
    // Throws SourceNotFoundError when the source does not exist.
    TransferOutcome safeMove(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             bool allowUpgrade = false) const;

    void setPolicy(TransferPolicy policy);
    const TransferPolicy& policy() const;
    void setProgressCallback(ProgressCallback callback);
    // Replace std::filesystem::rename for direct moves, e.g. to exercise the cross-device path.
    void setRenameFunction(RenameFunction rename);

    static std::filesystem::path stagingPathFor(const std::filesystem::path& destination);

private:
    // Decide whether an existing destination may be replaced.
    bool shouldReplace(std::uintmax_t sourceSize, std::uintmax_t destinationSize, bool allowUpgrade) const;
    // Rename in place, falling back to a staged copy across devices.
    TransferOutcome directMove(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               DestinationState onSuccess) const;
    // Copy into the staging file, rename it over the destination, then drop the source unless kept.
    TransferOutcome stagedCopy(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               DestinationState onSuccess,
                               bool keepSource) const;
    // Stream the source into the staging file; returns false on any read or write error.
    bool streamCopy(const std::filesystem::path& source,
                    const std::filesystem::path& staging,
                    std::uintmax_t total) const;
    static bool isSameEntry(const std::filesystem::path& source, const std::filesystem::path& destination);
    static bool ensureParentDirectory(const std::filesystem::path& destination);

    TransferPolicy m_policy;
    ProgressCallback m_progress;
    RenameFunction m_rename;
};

#endif
