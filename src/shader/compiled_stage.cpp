// Prism Shader Core
// compiled_stage.cpp - One successfully compiled shader stage

#include <prism/core/logger.hpp>
#include <prism/graphics/backend.hpp>
#include <prism/shader/compiled_stage.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/shader_source.hpp>

namespace prism::shader {

std::unique_ptr<CompiledStage> CompiledStage::compile(graphics::ShaderBackend& backend, const ShaderSource& source) {
    const auto stage = source.stage();
    const auto name = graphics::stage_name(stage);

    graphics::ShaderHandle handle = backend.create_shader(stage);
    if (handle == graphics::NULL_HANDLE) {
        PRISM_LOG_ERROR(core::log_category::SHADER, "Failed to create {} shader object for {}", name,
                        source.display_name());
        throw ShaderError::compilation_failed(name, "failed to create shader object");
    }

    backend.shader_source(handle, source.text());
    auto status = backend.compile_shader(handle);
    if (!status.success) {
        backend.delete_shader(handle);
        PRISM_LOG_ERROR(core::log_category::SHADER, "Failed to compile {} shader {}:\n{}", name,
                        source.display_name(), status.log);
        throw ShaderError::compilation_failed(name, status.log);
    }

    PRISM_LOG_DEBUG(core::log_category::SHADER, "Compiled {} shader {} (handle {})", name, source.display_name(),
                    handle);
    return std::unique_ptr<CompiledStage>(new CompiledStage(backend, stage, handle));
}

CompiledStage::CompiledStage(graphics::ShaderBackend& backend, graphics::StageKind stage,
                             graphics::ShaderHandle handle)
    : backend_(backend), stage_(stage), handle_(handle) {}

CompiledStage::~CompiledStage() {
    dispose();
}

void CompiledStage::dispose() {
    if (disposed_) {
        return;
    }
    backend_.delete_shader(handle_);
    disposed_ = true;
}

}  // namespace prism::shader
