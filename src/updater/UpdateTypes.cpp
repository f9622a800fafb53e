#include "UpdateTypes.hpp"

namespace updater
{

const char* updateStateToString(UpdateState state)
{
    switch (state)
    {
    case UpdateState::Idle:
        return "Idle";
    case UpdateState::Downloading:
        return "Downloading";
    case UpdateState::Extracting:
        return "Extracting";
    case UpdateState::BackingUp:
        return "Backing Up";
    case UpdateState::Purging:
        return "Purging";
    case UpdateState::Installing:
        return "Installing";
    case UpdateState::Restoring:
        return "Restoring";
    case UpdateState::Verifying:
        return "Verifying";
    case UpdateState::Done:
        return "Done";
    case UpdateState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "None";
    case ErrorKind::DownloadError:
        return "DownloadError";
    case ErrorKind::ArchiveError:
        return "ArchiveError";
    case ErrorKind::ContentNotFound:
        return "ContentNotFound";
    case ErrorKind::WriteError:
        return "WriteError";
    case ErrorKind::VersionUnresolvable:
        return "VersionUnresolvable";
    case ErrorKind::PartialUpdateRestoreAttempted:
        return "PartialUpdateRestoreAttempted";
    case ErrorKind::Busy:
        return "Busy";
    }
    return "Unknown";
}

} // namespace updater
