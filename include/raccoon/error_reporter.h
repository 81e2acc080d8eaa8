#ifndef RACCOON_ERROR_REPORTER_H
#define RACCOON_ERROR_REPORTER_H

#include <raccoon/config.h>
#include <raccoon/error.h>
#include <raccoon/result.h>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <fstream>
#include <atomic>
#include <mutex>
#include <map>

namespace raccoon {

/**
 * ErrorReporter is the diagnostic log of a scan.
 *
 * Probe components report through a shared instance:
 * 1. Per-vector execution failures at WARNING with their full parameters
 * 2. Escalation decisions at DEBUG
 * 3. Scan-wide failures at ERROR
 *
 * Output goes to stderr or to an append-mode log file, formatted as
 * human-readable text or JSON. Registered callbacks receive every report
 * that passes the level filter.
 */
class RACCOON_API ErrorReporter {
public:
    enum class LogLevel {
        DEBUG,      // Detailed diagnostic information
        INFO,       // General operational information
        WARNING,    // Recovered failures
        ERROR,      // Error conditions
        CRITICAL    // Failures that stop the scan
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;

        std::string log_file_path;                 // Empty = stderr
        bool console_output = true;
        bool use_utc_timestamps = true;
        size_t max_log_entry_size = 4096;
    };

    struct ErrorReport {
        LogLevel level;
        RaccoonError error_code;
        std::string category;                     // e.g., "collector", "probe"
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string component;
        std::map<std::string, std::string> metadata;

        ErrorReport(LogLevel lvl, RaccoonError error, const std::string& msg)
            : level(lvl)
            , error_code(error)
            , message(msg)
            , timestamp(std::chrono::system_clock::now()) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&)>;

    ErrorReporter();
    explicit ErrorReporter(const ReportingConfig& config);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /**
     * Report an event
     * @param level Log level for the report
     * @param error Associated error code (SUCCESS for plain events)
     * @param category Reporting subsystem
     * @param message Descriptive message
     * @return Error if the report could not be written
     */
    Result<void> report_error(LogLevel level,
                              RaccoonError error,
                              const std::string& category,
                              const std::string& message);

    class ReportBuilder;
    ReportBuilder create_report(LogLevel level, RaccoonError error);

    Result<void> submit_report(const ErrorReport& report);

    /**
     * Replace the configuration. Reopens the log file when the path changes.
     */
    Result<void> update_configuration(const ReportingConfig& config);
    ReportingConfig get_configuration() const;

    void add_reporter_callback(ReporterCallback callback);
    void clear_reporter_callbacks();

    Result<void> flush_logs();

    struct ReportingStatistics {
        std::atomic<uint64_t> total_reports{0};
        std::atomic<uint64_t> reports_by_level[5]{};
        std::atomic<uint64_t> failed_reports{0};
        std::atomic<uint64_t> bytes_logged{0};
    };

    const ReportingStatistics& get_statistics() const { return stats_; }
    uint64_t reports_at(LogLevel level) const;
    void reset_statistics();

    static std::string log_level_to_string(LogLevel level);

private:
    ReportingConfig config_;
    mutable std::mutex config_mutex_;

    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex output_mutex_;

    std::vector<ReporterCallback> custom_reporters_;
    mutable std::mutex reporters_mutex_;

    mutable ReportingStatistics stats_;

    Result<void> write_report(const ErrorReport& report, const ReportingConfig& config);
    std::string format_report(const ErrorReport& report, const ReportingConfig& config) const;
    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp,
                                 bool utc) const;
    Result<void> open_log_file(const std::string& path);
    static std::string escape_json(const std::string& input);
};

/**
 * ReportBuilder provides a fluent interface for reports with metadata
 */
class RACCOON_API ErrorReporter::ReportBuilder {
public:
    ReportBuilder(ErrorReporter& reporter, LogLevel level, RaccoonError error);

    ReportBuilder& category(const std::string& cat);
    ReportBuilder& message(const std::string& msg);
    ReportBuilder& metadata(const std::string& key, const std::string& value);
    ReportBuilder& component(const std::string& comp);

    Result<void> submit();

private:
    ErrorReporter& reporter_;
    ErrorReport report_;
};

// Convenience macros; the reporter may be null
#define RACCOON_REPORT(reporter, level, error, message) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_error((level), (error), __FUNCTION__, (message)); \
        } \
    } while(0)

#define RACCOON_REPORT_DEBUG(reporter, message) \
    RACCOON_REPORT(reporter, ::raccoon::ErrorReporter::LogLevel::DEBUG, \
                   ::raccoon::RaccoonError::SUCCESS, message)

#define RACCOON_REPORT_INFO(reporter, message) \
    RACCOON_REPORT(reporter, ::raccoon::ErrorReporter::LogLevel::INFO, \
                   ::raccoon::RaccoonError::SUCCESS, message)

#define RACCOON_REPORT_WARNING(reporter, error, message) \
    RACCOON_REPORT(reporter, ::raccoon::ErrorReporter::LogLevel::WARNING, error, message)

#define RACCOON_REPORT_ERROR(reporter, error, message) \
    RACCOON_REPORT(reporter, ::raccoon::ErrorReporter::LogLevel::ERROR, error, message)

} // namespace raccoon

#endif // RACCOON_ERROR_REPORTER_H
