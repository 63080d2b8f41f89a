#include "anchorpatch/io/run_log.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace anchorpatch {

namespace {

const std::string rule(80, '=');

auto format_time(std::chrono::system_clock::time_point point, const char* format,
                 bool with_millis = false) -> std::string {
    auto seconds = std::chrono::system_clock::to_time_t(point);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, format);
    if (with_millis) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          point.time_since_epoch())
                      % 1000;
        oss << "." << std::setw(3) << std::setfill('0') << millis.count();
    }
    return oss.str();
}

} // namespace

auto default_log_path() -> std::string {
    return "anchorpatch_" + format_time(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S")
           + ".log";
}

FileRunLog::FileRunLog(std::string path)
    : path_(std::move(path)), started_(std::chrono::system_clock::now()) {
    std::filesystem::path log_path(path_);
    if (log_path.has_parent_path()) {
        std::error_code ignored;
        std::filesystem::create_directories(log_path.parent_path(), ignored);
    }

    stream_.open(path_, std::ios::trunc);
    write_header();
}

FileRunLog::~FileRunLog() {
    write_footer();
}

auto FileRunLog::log_event(const std::string& event_type, const std::string& message,
                           const std::string& details) -> void {
    if (!stream_.is_open()) {
        check_stream();
        return;
    }

    stream_ << "[" << format_time(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S", true)
            << "] " << event_type << ": " << message << "\n";

    if (!details.empty()) {
        std::istringstream lines(details);
        std::string line;
        while (std::getline(lines, line)) {
            stream_ << "    " << line << "\n";
        }
    }
    stream_ << "\n";
    stream_.flush();
    check_stream();
}

auto FileRunLog::write_header() -> void {
    if (!stream_.is_open()) {
        check_stream();
        return;
    }

    std::error_code error;
    auto working_directory = std::filesystem::current_path(error);
    auto absolute = std::filesystem::absolute(path_, error);

    stream_ << rule << "\n";
    stream_ << "ANCHORPATCH LOG\n";
    stream_ << rule << "\n";
    stream_ << "Session started: " << format_time(started_, "%Y-%m-%d %H:%M:%S") << "\n";
    stream_ << "Working directory: " << working_directory.string() << "\n";
    stream_ << "Log file: " << absolute.string() << "\n";
    stream_ << rule << "\n\n";
    stream_.flush();
    check_stream();
}

auto FileRunLog::write_footer() -> void {
    if (!stream_.is_open() || !stream_.good()) {
        return;
    }

    auto ended = std::chrono::system_clock::now();
    auto duration = std::chrono::duration<double>(ended - started_).count();

    stream_ << rule << "\n";
    stream_ << "SESSION ENDED\n";
    stream_ << rule << "\n";
    stream_ << "End time: " << format_time(ended, "%Y-%m-%d %H:%M:%S") << "\n";
    stream_ << "Duration: " << std::fixed << std::setprecision(3) << duration << "s\n";
    stream_ << rule << "\n";
    stream_.flush();
}

auto FileRunLog::check_stream() -> void {
    if ((stream_.is_open() && stream_.good()) || failure_reported_) {
        return;
    }
    failure_reported_ = true;
    std::cerr << "Warning: could not write to log file " << path_ << "\n";
}

} // namespace anchorpatch
