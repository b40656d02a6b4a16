// Prism Shader Core
// shader_manifest.hpp - JSON list of named shaders for bulk registration

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace prism::shader {

class ShaderLoader;
class ShaderRegistry;

struct ManifestEntry {
    std::string name;
    std::string base_path;                 // Set for "name": "base/path"
    std::vector<std::string> stage_paths;  // Set for "name": ["a.vert", "a.frag", ...]

    [[nodiscard]] bool is_pair() const { return stage_paths.empty(); }
};

// Manifest format:
//
//   {
//     "shaders": {
//       "basic": "core/basic",
//       "terrain": ["terrain/terrain.vert", "terrain/terrain.geom", "terrain/terrain.frag"]
//     }
//   }
//
// A string entry names a .vert/.frag pair by base path; an array entry lists
// stage files whose stages come from their extensions.
class ShaderManifest {
public:
    ShaderManifest() = default;

    // Throws ShaderError::InvalidState for malformed documents
    [[nodiscard]] static ShaderManifest parse(std::string_view text);

    // Throws ShaderError: ResourceNotFound, IoError, InvalidState
    [[nodiscard]] static ShaderManifest load(const std::filesystem::path& path);

    // Sorted by name
    [[nodiscard]] const std::vector<ManifestEntry>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    // Register a lazy supplier for every entry; returns the number registered
    size_t register_all(ShaderRegistry& registry, const ShaderLoader& loader) const;

private:
    std::vector<ManifestEntry> entries_;
};

}  // namespace prism::shader
