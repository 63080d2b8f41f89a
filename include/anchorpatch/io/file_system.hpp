#pragma once

#include "anchorpatch/core/document.hpp"
#include "anchorpatch/interfaces.hpp"
#include <optional>
#include <string>
#include <vector>

namespace anchorpatch {

class FileSystem : public IFileSystem {
public:
    auto read_document(const std::string& path) -> std::optional<Document> override;
    auto write_document(const Document& document, const std::string& path) -> bool override;
    auto create_backup(const std::string& path) -> std::optional<std::string> override;
    auto read_text(const std::string& path) -> std::optional<std::string> override;
    auto list_patch_files(const std::string& directory) -> std::vector<std::string> override;
    auto file_exists(const std::string& path) -> bool override;

private:
    auto write_text_atomic(const std::string& text, const std::string& path) -> bool;
};

// "<stem>_<ddmmyy_HHMM>.bak" beside path
auto backup_path_for(const std::string& path, const std::string& timestamp) -> std::string;

} // namespace anchorpatch
