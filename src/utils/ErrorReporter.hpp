#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Configuration, // TOML parsing, invalid settings
    Input,         // Unreadable document, candidate or script files
    Resolution,    // Candidate validation and overlap resolution
    Grouping,      // Group creation and cascades
    Substitution,  // Text rewriting
    Export,        // Writing text or bundle output
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded result, run continues
    Error,   // Stage failed
    Fatal    // Run cannot continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Paths, parser messages, record indexes
    std::string timestamp;         // UTC, ISO-8601

    bool isFatal() const { return severity == ErrorSeverity::Fatal; }
};

/**
 * @brief Collects problems raised while a document is processed
 *
 * Every report is logged through plog when it is raised and kept in a
 * bounded queue; the command-line front end drains the queue once the run
 * ends and prints it to stderr.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Input, "Skipped candidate record",
 *                                "record 3: missing 'text'");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::Format(report) << "\n";
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static bool HasPendingErrors();

    /// Number of queued reports at `severity` or above
    static std::size_t CountAtLeast(ErrorSeverity severity);

    /**
     * @brief Takes every pending report, oldest first, and empties the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    /// "[Warning] [Input] Skipped candidate record: record 3: missing 'text'"
    static std::string Format(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
    static constexpr std::size_t kMaxQueueSize = 100;
};

} // namespace utils
