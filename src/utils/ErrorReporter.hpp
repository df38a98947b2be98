#pragma once

#include <cstddef>
#include <ios>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, translator backend, writer startup
    Configuration,  // TOML parsing, invalid settings, CLI arguments
    FileSystem,     // input discovery, reading, unreadable files
    Segmentation,   // unsupported strategy, malformed documents
    Translation,    // remote API failures, count mismatches
    Cache,          // journal load/flush failures
    Output,         // write, backup and rollback failures
    Unknown
};

enum class ErrorSeverity
{
    Warning, // Degraded, the run continues unchanged
    Error    // A document or the whole run failed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string message;
    std::string details;
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string tech_details);
};

/**
 * @brief Thread-safe error ledger shared by every subsystem of a run
 *
 * Each report is logged through plog, appended to the error log file when one is
 * configured, and kept in a bounded history so the end-of-run summary can say how
 * much went wrong.
 *
 * Usage:
 *   ErrorReporter::InitializeLogFile("logs/errors.log");
 *   ErrorReporter::ReportWarning(ErrorCategory::Cache, "Translation cache disabled", error);
 *
 *   // In the summary:
 *   auto counts = ErrorReporter::GetCounts();
 */
class ErrorReporter
{
public:
    struct Counts
    {
        std::size_t warnings = 0;
        std::size_t errors = 0;
    };

    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details = "");

    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");

    static void ReportWarning(ErrorCategory category, const std::string& message,
                              const std::string& details = "");

    /**
     * @brief Totals since the last Reset(); they keep counting after history entries roll off
     */
    static Counts GetCounts();

    /**
     * @brief Most recent reports, oldest first
     */
    static std::vector<ErrorReport> GetHistorySnapshot();

    static void Reset();

    /**
     * @brief Configure a plain-text file that receives every later report
     * @return false when the file cannot be opened; reports are then only logged
     */
    static bool InitializeLogFile(const std::string& path, std::ios::openmode mode = std::ios::app);

    static std::string CategoryToString(ErrorCategory category);

    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

    /**
     * @brief Single-line rendering used by the error log
     */
    static std::string FormatReport(const ErrorReport& report);

private:
    static void WriteToLogFileLocked(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_history;
    static Counts s_counts;
    static std::string s_log_path;
    static constexpr std::size_t MAX_HISTORY_SIZE = 500;
};

} // namespace utils
