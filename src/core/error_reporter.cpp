#include <raccoon/error_reporter.h>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <sstream>

namespace raccoon {

ErrorReporter::ErrorReporter() : config_{} {}

ErrorReporter::ErrorReporter(const ReportingConfig& config) : config_(config) {
    if (!config_.log_file_path.empty()) {
        auto result = open_log_file(config_.log_file_path);
        if (!result.is_success()) {
            // Keep reporting to the console rather than losing reports
            std::cerr << "[reporter] Error " << static_cast<int>(result.error())
                      << ": cannot open log file " << config_.log_file_path << std::endl;
            config_.log_file_path.clear();
            config_.console_output = true;
        }
    }
}

ErrorReporter::~ErrorReporter() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (log_file_ && log_file_->is_open()) {
        log_file_->flush();
    }
}

Result<void> ErrorReporter::report_error(LogLevel level,
                                         RaccoonError error,
                                         const std::string& category,
                                         const std::string& message) {
    ErrorReport report(level, error, message);
    report.category = category;
    return submit_report(report);
}

ErrorReporter::ReportBuilder ErrorReporter::create_report(LogLevel level, RaccoonError error) {
    return ReportBuilder(*this, level, error);
}

Result<void> ErrorReporter::submit_report(const ErrorReport& report) {
    ReportingConfig config;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config = config_;
    }

    if (report.level < config.minimum_level) {
        return make_result();
    }

    size_t level_index = static_cast<size_t>(report.level);
    if (level_index < 5) {
        stats_.reports_by_level[level_index]++;
    }

    {
        std::lock_guard<std::mutex> lock(reporters_mutex_);
        for (const auto& callback : custom_reporters_) {
            callback(report);
        }
    }

    auto result = write_report(report, config);
    if (!result.is_success()) {
        stats_.failed_reports++;
        return result;
    }

    stats_.total_reports++;
    return make_result();
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    std::string previous_path;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        previous_path = config_.log_file_path;
    }

    if (config.log_file_path != previous_path) {
        if (config.log_file_path.empty()) {
            std::lock_guard<std::mutex> lock(output_mutex_);
            log_file_.reset();
        } else {
            auto result = open_log_file(config.log_file_path);
            if (!result.is_success()) {
                return result;
            }
        }
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.clear();
}

Result<void> ErrorReporter::flush_logs() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (log_file_ && log_file_->is_open()) {
        log_file_->flush();
        if (log_file_->fail()) {
            return make_error<void>(RaccoonError::LOG_FILE_ERROR);
        }
    }
    std::cerr.flush();
    return make_result();
}

uint64_t ErrorReporter::reports_at(LogLevel level) const {
    size_t level_index = static_cast<size_t>(level);
    if (level_index >= 5) {
        return 0;
    }
    return stats_.reports_by_level[level_index].load();
}

void ErrorReporter::reset_statistics() {
    stats_.total_reports = 0;
    for (auto& counter : stats_.reports_by_level) {
        counter = 0;
    }
    stats_.failed_reports = 0;
    stats_.bytes_logged = 0;
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

// Private method implementations

Result<void> ErrorReporter::write_report(const ErrorReport& report, const ReportingConfig& config) {
    std::string formatted = format_report(report, config);
    if (formatted.size() > config.max_log_entry_size) {
        formatted.resize(config.max_log_entry_size);
    }

    std::lock_guard<std::mutex> lock(output_mutex_);

    if (log_file_ && log_file_->is_open()) {
        *log_file_ << formatted << '\n';
        if (log_file_->fail()) {
            return make_error<void>(RaccoonError::LOG_FILE_ERROR);
        }
    } else if (config.console_output) {
        std::cerr << formatted << std::endl;
    }

    stats_.bytes_logged += formatted.length();
    return make_result();
}

std::string ErrorReporter::format_report(const ErrorReport& report, const ReportingConfig& config) const {
    std::ostringstream oss;
    std::string timestamp = format_timestamp(report.timestamp, config.use_utc_timestamps);

    if (config.format == OutputFormat::JSON) {
        oss << "{\"timestamp\":\"" << timestamp << "\""
            << ",\"level\":\"" << log_level_to_string(report.level) << "\""
            << ",\"error\":" << static_cast<int>(report.error_code)
            << ",\"category\":\"" << escape_json(report.category) << "\""
            << ",\"message\":\"" << escape_json(report.message) << "\"";

        if (!report.component.empty()) {
            oss << ",\"component\":\"" << escape_json(report.component) << "\"";
        }
        if (!report.metadata.empty()) {
            oss << ",\"metadata\":{";
            bool first = true;
            for (const auto& [key, value] : report.metadata) {
                if (!first) {
                    oss << ",";
                }
                oss << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
                first = false;
            }
            oss << "}";
        }

        oss << "}";
    } else {
        oss << timestamp << " " << std::left << std::setw(8) << log_level_to_string(report.level)
            << "[" << report.category << "] ";
        if (report.error_code != RaccoonError::SUCCESS) {
            oss << "Error " << static_cast<int>(report.error_code) << ": ";
        }
        oss << report.message;

        for (const auto& [key, value] : report.metadata) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string ErrorReporter::format_timestamp(const std::chrono::system_clock::time_point& timestamp,
                                            bool utc) const {
    auto t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_value{};
    if (utc) {
        gmtime_r(&t, &tm_value);
    } else {
        localtime_r(&t, &tm_value);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

Result<void> ErrorReporter::open_log_file(const std::string& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        return make_error<void>(RaccoonError::LOG_FILE_ERROR);
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    log_file_ = std::move(file);
    return make_result();
}

std::string ErrorReporter::escape_json(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

// ReportBuilder

ErrorReporter::ReportBuilder::ReportBuilder(ErrorReporter& reporter, LogLevel level, RaccoonError error)
    : reporter_(reporter)
    , report_(level, error, "") {}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::category(const std::string& cat) {
    report_.category = cat;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::message(const std::string& msg) {
    report_.message = msg;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::metadata(const std::string& key,
                                                                      const std::string& value) {
    report_.metadata[key] = value;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::component(const std::string& comp) {
    report_.component = comp;
    return *this;
}

Result<void> ErrorReporter::ReportBuilder::submit() {
    return reporter_.submit_report(report_);
}

} // namespace raccoon
