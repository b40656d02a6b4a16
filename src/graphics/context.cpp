// Prism Graphics Layer
// context.cpp - Execution context implementation

#include <prism/graphics/backend.hpp>
#include <prism/graphics/context.hpp>

namespace prism::graphics {

GraphicsContext::GraphicsContext(ShaderBackend& backend) : backend_(backend) {}

bool GraphicsContext::use_program(ProgramHandle program) {
    std::lock_guard lock(mutex_);
    if (bound_ == program) {
        return false;
    }
    backend_.use_program(program);
    bound_ = program;
    return true;
}

bool GraphicsContext::release_program(ProgramHandle program) {
    std::lock_guard lock(mutex_);
    if (program == NULL_HANDLE || bound_ != program) {
        return false;
    }
    backend_.use_program(NULL_HANDLE);
    bound_ = NULL_HANDLE;
    return true;
}

void GraphicsContext::clear_program() {
    std::lock_guard lock(mutex_);
    backend_.use_program(NULL_HANDLE);
    bound_ = NULL_HANDLE;
}

ProgramHandle GraphicsContext::bound_program() const {
    std::lock_guard lock(mutex_);
    return bound_;
}

bool GraphicsContext::is_bound(ProgramHandle program) const {
    std::lock_guard lock(mutex_);
    return program != NULL_HANDLE && bound_ == program;
}

}  // namespace prism::graphics
