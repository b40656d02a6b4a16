// Prism Shader Core
// source_reader.cpp - Raw shader text providers

#include <prism/core/logger.hpp>
#include <prism/platform/file_io.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/source_reader.hpp>

#include <algorithm>

namespace prism::shader {

std::string normalize_logical_path(std::string_view path) {
    std::string normalized = std::filesystem::path(path).lexically_normal().generic_string();
    while (!normalized.empty() && normalized.front() == '/') {
        normalized.erase(normalized.begin());
    }
    if (normalized == ".") {
        normalized.clear();
    }
    return normalized;
}

std::string logical_directory(std::string_view path) {
    size_t separator = path.find_last_of("/\\");
    if (separator == std::string_view::npos) {
        return {};
    }
    return std::string(path.substr(0, separator));
}

std::string SourceReader::resolve_identity(const std::string& logical_path) const {
    return normalize_logical_path(logical_path);
}

// ============================================================================
// FileSourceReader
// ============================================================================

FileSourceReader::FileSourceReader(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileSourceReader::to_filesystem_path(const std::string& logical_path) const {
    std::filesystem::path path(logical_path);
    if (path.is_absolute() || root_.empty()) {
        return path;
    }
    return root_ / path;
}

std::string FileSourceReader::read_text(const std::string& logical_path) const {
    auto path = to_filesystem_path(logical_path);

    if (!platform::FileSystem::exists(path)) {
        throw ShaderError::resource_not_found(logical_path);
    }
    if (!platform::FileSystem::is_file(path)) {
        throw ShaderError::io_error(logical_path, "not a regular file");
    }

    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        throw ShaderError::io_error(logical_path, "read failed: " + path.string());
    }

    PRISM_LOG_TRACE(core::log_category::IO, "Read {} bytes from {}", content->size(), path.string());
    return std::move(*content);
}

std::string FileSourceReader::resolve_identity(const std::string& logical_path) const {
    auto path = platform::FileSystem::make_absolute(to_filesystem_path(logical_path));
    return platform::FileSystem::normalize(path).generic_string();
}

// ============================================================================
// MemorySourceReader
// ============================================================================

void MemorySourceReader::add(std::string logical_path, std::string text) {
    std::lock_guard lock(mutex_);
    sources_[normalize_logical_path(logical_path)] = std::move(text);
}

bool MemorySourceReader::remove(const std::string& logical_path) {
    std::lock_guard lock(mutex_);
    return sources_.erase(normalize_logical_path(logical_path)) > 0;
}

bool MemorySourceReader::contains(const std::string& logical_path) const {
    std::lock_guard lock(mutex_);
    return sources_.count(normalize_logical_path(logical_path)) > 0;
}

std::vector<std::string> MemorySourceReader::paths() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sources_.size());
    for (const auto& [path, text] : sources_) {
        result.push_back(path);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::string MemorySourceReader::read_text(const std::string& logical_path) const {
    std::lock_guard lock(mutex_);
    auto it = sources_.find(normalize_logical_path(logical_path));
    if (it == sources_.end()) {
        throw ShaderError::resource_not_found(logical_path);
    }
    return it->second;
}

}  // namespace prism::shader
