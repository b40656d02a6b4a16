// Prism Shader Core
// compiled_stage.hpp - One successfully compiled shader stage

#pragma once

#include <prism/graphics/types.hpp>

#include <memory>

namespace prism::graphics {
class ShaderBackend;
}

namespace prism::shader {

class ShaderSource;

// Owns exactly one backend shader object. Only produced by a successful
// compile; a failed compile never yields a CompiledStage.
class CompiledStage {
public:
    // Create, upload and compile `source` (already preprocessed).
    // Throws ShaderError::CompilationFailed. Any backend object created along
    // the way is deleted before the error is raised.
    [[nodiscard]] static std::unique_ptr<CompiledStage> compile(graphics::ShaderBackend& backend,
                                                                const ShaderSource& source);

    ~CompiledStage();

    // Non-copyable
    CompiledStage(const CompiledStage&) = delete;
    CompiledStage& operator=(const CompiledStage&) = delete;

    // Delete the backend object. Idempotent.
    void dispose();

    [[nodiscard]] graphics::StageKind stage() const { return stage_; }
    [[nodiscard]] graphics::ShaderHandle handle() const { return handle_; }
    [[nodiscard]] bool is_disposed() const { return disposed_; }

private:
    CompiledStage(graphics::ShaderBackend& backend, graphics::StageKind stage, graphics::ShaderHandle handle);

    graphics::ShaderBackend& backend_;
    graphics::StageKind stage_;
    graphics::ShaderHandle handle_;
    bool disposed_ = false;
};

}  // namespace prism::shader
