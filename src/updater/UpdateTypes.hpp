#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace updater
{

// Self-update state machine
enum class UpdateState
{
    Idle, // No replace in flight
    Downloading, // Fetching the release archive into scratch space
    Extracting, // Unpacking and stripping the wrapper folder
    BackingUp, // Copying preserved entries aside
    Purging, // Deleting everything under the installation root
    Installing, // Copying the new payload in
    Restoring, // Putting preserved entries back
    Verifying, // Reading the version record, checking preserved digests
    Done, // Replace finished
    Failed // Replace aborted, see the error
};

const char* updateStateToString(UpdateState state);

enum class ErrorKind
{
    None,
    DownloadError, // network, timeout or HTTP status
    ArchiveError, // corrupt or unsupported archive
    ContentNotFound, // nothing in the archive matched the request
    WriteError, // filesystem
    VersionUnresolvable, // release carries no usable version
    PartialUpdateRestoreAttempted, // failed after Purging, restore was attempted
    Busy // a replace is already running
};

const char* errorKindToString(ErrorKind kind);

// Error information for failed updates
struct UpdateError
{
    ErrorKind kind = ErrorKind::None;
    std::string message; // Human-readable error message
    std::string technicalInfo; // Operation, step and path for the log
    std::string recoveryPath; // Backup area kept on disk when restore failed

    UpdateError() = default;

    UpdateError(ErrorKind k, const std::string& msg, const std::string& tech = "")
        : kind(k)
        , message(msg)
        , technicalInfo(tech)
    {
    }
};

// Release checks and content installs report the same shape
using CheckError = UpdateError;
using InstallError = UpdateError;

// One release as described by the releases API
struct ReleaseMetadata
{
    std::string tagVersion; // e.g. "1.4.2", leading 'v' removed
    std::string title;
    std::string releaseNotes;
    std::string downloadUrl; // packaged .zip asset, else the source snapshot
    bool isExperimental = false;
};

enum class AvailabilityStatus
{
    NotConfigured, // no update URL
    UpToDate,
    UpdateAvailable,
    NoReleaseFound // endpoint answered with an empty release list
};

struct UpdateAvailability
{
    AvailabilityStatus status = AvailabilityStatus::NotConfigured;
    std::string currentVersion;
    ReleaseMetadata release;

    bool updateAvailable() const { return status == AvailabilityStatus::UpdateAvailable; }
};

// Download progress information
struct DownloadProgress
{
    size_t bytesDownloaded; // Bytes downloaded so far
    size_t totalBytes; // Total package size, 0 when unknown
    float percentage; // Download percentage (0-100)
    std::string speed; // Human-readable speed (e.g., "2.5 MB/s")

    DownloadProgress()
        : bytesDownloaded(0)
        , totalBytes(0)
        , percentage(0.0f)
    {
    }
};

// Per-package failure in a batch install
struct PackageFailure
{
    std::string name;
    std::string message;
};

struct BatchInstallSummary
{
    size_t successCount = 0;
    std::vector<PackageFailure> failures;

    bool allSucceeded() const { return failures.empty(); }
};

} // namespace updater
