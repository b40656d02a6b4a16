// Prism Platform Layer
// file_io.hpp - File system helpers used by source readers and config

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace prism::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations
class FileSystem {
public:
    static fs::path get_temp_directory();

    // Path utilities
    static fs::path normalize(const fs::path& path);
    static fs::path make_absolute(const fs::path& path);

    // Synchronous text I/O
    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    // Directory operations
    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool is_file(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace prism::platform
