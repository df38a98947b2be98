#include "ErrorReporter.hpp"
#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_history;
ErrorReporter::Counts ErrorReporter::s_counts;
std::string ErrorReporter::s_log_path;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , message(std::move(msg))
    , details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
{
}

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    ErrorReport report(category, severity, message, details);

    std::string log_msg = "[" + CategoryToString(category) + "] " + message;
    if (!details.empty())
        log_msg += " | Details: " + details;

    if (severity == ErrorSeverity::Error)
        PLOG_ERROR << log_msg;
    else
        PLOG_WARNING << log_msg;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (severity == ErrorSeverity::Error)
        ++s_counts.errors;
    else
        ++s_counts.warnings;

    WriteToLogFileLocked(report);

    if (s_history.size() >= MAX_HISTORY_SIZE)
        s_history.erase(s_history.begin());
    s_history.push_back(std::move(report));
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, details);
}

ErrorReporter::Counts ErrorReporter::GetCounts()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_counts;
}

std::vector<ErrorReport> ErrorReporter::GetHistorySnapshot()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_history;
}

void ErrorReporter::Reset()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_history.clear();
    s_counts = {};
    s_log_path.clear();
}

bool ErrorReporter::InitializeLogFile(const std::string& path, std::ios::openmode mode)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::ofstream ofs(path, mode);
    if (!ofs)
    {
        s_log_path.clear();
        return false;
    }
    ofs << "\n=== transfold run started " << GetTimestamp() << " ===\n";
    s_log_path = path;
    return true;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::FileSystem:
        return "File System";
    case ErrorCategory::Segmentation:
        return "Segmentation";
    case ErrorCategory::Translation:
        return "Translation";
    case ErrorCategory::Cache:
        return "Cache";
    case ErrorCategory::Output:
        return "Output";
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    return severity == ErrorSeverity::Error ? "Error" : "Warning";
}

std::string ErrorReporter::GetTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string ErrorReporter::FormatReport(const ErrorReport& report)
{
    std::string line = "[" + report.timestamp + "] [" + CategoryToString(report.category) + "] [" +
                       SeverityToString(report.severity) + "] " + report.message;
    if (!report.details.empty())
        line += " | " + report.details;
    return line;
}

void ErrorReporter::WriteToLogFileLocked(const ErrorReport& report)
{
    if (s_log_path.empty())
        return;

    std::ofstream ofs(s_log_path, std::ios::app);
    if (ofs)
        ofs << FormatReport(report) << '\n';
}

} // namespace utils
