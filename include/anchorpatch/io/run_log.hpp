#pragma once

#include "anchorpatch/interfaces.hpp"
#include <chrono>
#include <fstream>
#include <string>

namespace anchorpatch {

// "anchorpatch_<YYYYmmdd_HHMMSS>.log" in the working directory
auto default_log_path() -> std::string;

// Append-only session log: header on open, one entry per event, footer on destruction.
// Write failures are reported once on stderr and never interrupt the run.
class FileRunLog : public IRunLog {
public:
    explicit FileRunLog(std::string path);
    ~FileRunLog() override;

    FileRunLog(const FileRunLog&) = delete;
    auto operator=(const FileRunLog&) -> FileRunLog& = delete;

    auto log_event(const std::string& event_type, const std::string& message,
                   const std::string& details) -> void override;

    auto path() const -> const std::string& { return path_; }

private:
    auto write_header() -> void;
    auto write_footer() -> void;
    auto check_stream() -> void;

    std::string path_;
    std::ofstream stream_;
    std::chrono::system_clock::time_point started_;
    bool failure_reported_ = false;
};

// --no-log
class NullRunLog : public IRunLog {
public:
    auto log_event(const std::string& /*event_type*/, const std::string& /*message*/,
                   const std::string& /*details*/) -> void override {}
};

} // namespace anchorpatch
