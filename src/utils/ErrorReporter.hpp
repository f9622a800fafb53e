#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, settings bootstrap
    Configuration,  // TOML/JSON parsing, invalid paths
    Network,        // release checks, downloads
    Archive,
    Install,        // content package installation
    Update          // self-update replace
};

enum class ErrorSeverity
{
    Warning, // the command carries on
    Error,   // the command failed
    Fatal    // the command could not start
};

struct ErrorReport
{
    ErrorCategory category;
    ErrorSeverity severity;
    std::string user_message;      // Short, actionable message for users
    std::string technical_details; // Operation, step and path for the log
};

/**
 * @brief Queue of user-facing problems for the command line
 *
 * Installer, updater and bootstrap code report here; every report is logged
 * through plog right away. The CLI drains the queue once the command has
 * finished and prints one summary line per report.
 *
 *   ErrorReporter::ReportError(ErrorCategory::Install, "Failed to install mod",
 *                              "write: /home/u/userdata/mods/x/data.json: Permission denied");
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Returns the queued reports oldest first and empties the queue
    static std::vector<ErrorReport> GetPendingErrors();

    // "Error [Install]: <user message>"
    static std::string Summarize(const ErrorReport& report);

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    // Oldest reports are dropped beyond this
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
