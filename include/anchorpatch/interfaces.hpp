#pragma once

#include <optional>
#include <string>
#include <vector>

namespace anchorpatch {

// Forward declarations
struct Choice;
struct DisambiguationRequest;
struct Document;
struct ParsedPatch;
struct PatchReport;

// Abstract interfaces for dependency injection

// Asked whenever an anchor matches more than once. Blocks until a choice is made.
class IDisambiguator {
public:
    virtual ~IDisambiguator() = default;
    virtual auto resolve(const DisambiguationRequest& request) -> Choice = 0;
};

class ITerminal : public IDisambiguator {
public:
    virtual auto is_interactive() -> bool = 0;
    virtual auto prompt_line(const std::string& question) -> std::string = 0;
    virtual auto read_patch_text() -> std::string = 0;
    virtual auto choose_patch_file(const std::vector<std::string>& paths) -> std::optional<size_t> = 0;
    virtual auto confirm(const std::string& question) -> bool = 0;
    virtual auto show_report(const PatchReport& report) -> void = 0;
    virtual auto show_message(const std::string& message) -> void = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_document(const std::string& path) -> std::optional<Document> = 0;
    virtual auto write_document(const Document& document, const std::string& path) -> bool = 0;
    virtual auto create_backup(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto read_text(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto list_patch_files(const std::string& directory) -> std::vector<std::string> = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

class IPatchParser {
public:
    virtual ~IPatchParser() = default;
    virtual auto parse_patch(const std::string& patch_text) -> ParsedPatch = 0;
};

class IRunLog {
public:
    virtual ~IRunLog() = default;
    virtual auto log_event(const std::string& event_type, const std::string& message,
                           const std::string& details) -> void = 0;
};

} // namespace anchorpatch
