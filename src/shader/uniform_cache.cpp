// Prism Shader Core
// uniform_cache.cpp - Per-program uniform location memoization

#include <prism/core/logger.hpp>
#include <prism/graphics/backend.hpp>
#include <prism/shader/uniform_cache.hpp>

namespace prism::shader {

UniformCache::UniformCache(graphics::ShaderBackend& backend, graphics::ProgramHandle program)
    : backend_(backend), program_(program) {}

int32_t UniformCache::location(const std::string& name) {
    auto it = locations_.find(name);
    if (it != locations_.end()) {
        return it->second;
    }

    int32_t location = backend_.get_uniform_location(program_, name);
    if (location < 0) {
        location = graphics::INVALID_LOCATION;
        PRISM_LOG_TRACE(core::log_category::SHADER, "Uniform '{}' not active in program {}", name, program_);
    }
    locations_.emplace(name, location);
    return location;
}

}  // namespace prism::shader
