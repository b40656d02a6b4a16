// Prism Shader Core
// source_reader.hpp - Raw shader text providers

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace prism::shader {

// Reads raw shader text by logical path ("lighting/common.glsl").
// Logical paths always use '/' separators.
class SourceReader {
public:
    virtual ~SourceReader() = default;

    // Throws ShaderError (ResourceNotFound or IoError)
    [[nodiscard]] virtual std::string read_text(const std::string& logical_path) const = 0;

    // Identity of the file a logical path refers to. Two paths that name the
    // same file yield the same identity; used for include-cycle detection.
    [[nodiscard]] virtual std::string resolve_identity(const std::string& logical_path) const;
};

// Reads from a directory on disk
class FileSourceReader final : public SourceReader {
public:
    explicit FileSourceReader(std::filesystem::path root = {});

    [[nodiscard]] std::string read_text(const std::string& logical_path) const override;
    [[nodiscard]] std::string resolve_identity(const std::string& logical_path) const override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    [[nodiscard]] std::filesystem::path to_filesystem_path(const std::string& logical_path) const;

    std::filesystem::path root_;
};

// Reads from an in-memory table; the embedded-resource equivalent
class MemorySourceReader final : public SourceReader {
public:
    MemorySourceReader() = default;

    // Replaces any previous text stored under the same path
    void add(std::string logical_path, std::string text);
    bool remove(const std::string& logical_path);
    [[nodiscard]] bool contains(const std::string& logical_path) const;
    [[nodiscard]] std::vector<std::string> paths() const;

    [[nodiscard]] std::string read_text(const std::string& logical_path) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> sources_;
};

// Lexically normalize a logical path: collapse "." and "..", drop a leading "/"
[[nodiscard]] std::string normalize_logical_path(std::string_view path);

// Directory part of a logical path ("a/b/c.glsl" -> "a/b", "c.glsl" -> "")
[[nodiscard]] std::string logical_directory(std::string_view path);

}  // namespace prism::shader
