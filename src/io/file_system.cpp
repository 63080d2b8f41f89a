#include "anchorpatch/io/file_system.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace anchorpatch {

namespace {

auto backup_timestamp() -> std::string {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%d%m%y_%H%M");
    return oss.str();
}

auto lowercase(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

auto backup_path_for(const std::string& path, const std::string& timestamp) -> std::string {
    std::filesystem::path original(path);
    auto name = original.stem().string() + "_" + timestamp + ".bak";
    return (original.parent_path() / name).string();
}

auto FileSystem::read_document(const std::string& path) -> std::optional<Document> {
    auto text = read_text(path);
    if (!text) {
        return std::nullopt;
    }
    return parse_document(*text);
}

auto FileSystem::write_document(const Document& document, const std::string& path) -> bool {
    return write_text_atomic(render_document(document), path);
}

auto FileSystem::create_backup(const std::string& path) -> std::optional<std::string> {
    auto backup = backup_path_for(path, backup_timestamp());

    std::error_code error;
    std::filesystem::copy_file(path, backup, std::filesystem::copy_options::overwrite_existing,
                               error);
    if (error) {
        return std::nullopt;
    }
    return backup;
}

auto FileSystem::read_text(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

auto FileSystem::list_patch_files(const std::string& directory) -> std::vector<std::string> {
    std::vector<std::string> paths;

    std::error_code error;
    std::filesystem::directory_iterator it(directory.empty() ? "." : directory, error);
    if (error) {
        return paths;
    }

    for (const auto& entry : it) {
        if (entry.is_regular_file(error) && entry.path().extension() == ".diff") {
            paths.push_back(entry.path().string());
        }
    }

    std::sort(paths.begin(), paths.end(), [](const std::string& a, const std::string& b) {
        return lowercase(std::filesystem::path(a).filename().string())
               < lowercase(std::filesystem::path(b).filename().string());
    });
    return paths;
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code error;
    return std::filesystem::is_regular_file(path, error);
}

auto FileSystem::write_text_atomic(const std::string& text, const std::string& path) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << text;
        if (file.fail()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    } // File automatically closed here

    std::error_code error;
    std::filesystem::rename(temp_path, path, error);
    if (error) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

} // namespace anchorpatch
