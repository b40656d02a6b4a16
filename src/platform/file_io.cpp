// Prism Platform Layer
// file_io.cpp - File system helpers implementation

#include <prism/platform/file_io.hpp>

#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>

namespace prism::platform {

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / "prism";
}

fs::path FileSystem::normalize(const fs::path& path) {
    try {
        return fs::weakly_canonical(path);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to normalize path '{}': {}", path.string(), e.what());
        return path.lexically_normal();
    }
}

fs::path FileSystem::make_absolute(const fs::path& path) {
    if (path.is_absolute()) {
        return path;
    }
    return fs::absolute(path);
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        if (file.bad()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    try {
        if (path.has_parent_path()) {
            create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file << content;

        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::create_directories(const fs::path& path) {
    try {
        return fs::create_directories(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::exists(const fs::path& path) {
    try {
        return fs::exists(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking existence of '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::is_file(const fs::path& path) {
    try {
        return fs::is_regular_file(path);
    } catch (const std::exception& e) {
        spdlog::warn("Error checking if '{}' is file: {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::remove_all(const fs::path& path) {
    try {
        fs::remove_all(path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove all '{}': {}", path.string(), e.what());
        return false;
    }
}

}  // namespace prism::platform
