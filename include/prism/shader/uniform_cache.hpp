// Prism Shader Core
// uniform_cache.hpp - Per-program uniform location memoization

#pragma once

#include <prism/graphics/types.hpp>

#include <string>
#include <unordered_map>

namespace prism::graphics {
class ShaderBackend;
}

namespace prism::shader {

// Name -> location lookups for one program link generation.
// Misses (INVALID_LOCATION) are cached as well, so optional uniforms that a
// shader does not declare cost one backend query in total.
class UniformCache {
public:
    UniformCache(graphics::ShaderBackend& backend, graphics::ProgramHandle program);

    // Cached location, querying the backend on first use of `name`
    [[nodiscard]] int32_t location(const std::string& name);

    [[nodiscard]] bool exists(const std::string& name) { return location(name) != graphics::INVALID_LOCATION; }

    // Drop every entry; required after the program is relinked
    void invalidate() { locations_.clear(); }

    [[nodiscard]] size_t size() const { return locations_.size(); }
    [[nodiscard]] graphics::ProgramHandle program() const { return program_; }

private:
    graphics::ShaderBackend& backend_;
    graphics::ProgramHandle program_;
    std::unordered_map<std::string, int32_t> locations_;
};

}  // namespace prism::shader
