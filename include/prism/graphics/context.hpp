// Prism Graphics Layer
// context.hpp - Execution context tracking the active program

#pragma once

#include "types.hpp"

#include <mutex>

namespace prism::graphics {

class ShaderBackend;

// One graphics execution context: the backend it drives plus the program
// currently active in it. Programs bind and unbind through their context,
// so two contexts never share "currently bound" state.
class GraphicsContext {
public:
    explicit GraphicsContext(ShaderBackend& backend);
    ~GraphicsContext() = default;

    // Non-copyable, non-movable (programs hold references to their context)
    GraphicsContext(const GraphicsContext&) = delete;
    GraphicsContext& operator=(const GraphicsContext&) = delete;
    GraphicsContext(GraphicsContext&&) = delete;
    GraphicsContext& operator=(GraphicsContext&&) = delete;

    [[nodiscard]] ShaderBackend& backend() const { return backend_; }

    // Activate a program. Returns false without touching the backend when the
    // program is already active.
    bool use_program(ProgramHandle program);

    // Deactivate `program` if it is the active one. Returns true if a
    // backend call was issued.
    bool release_program(ProgramHandle program);

    // Deactivate whatever program is active
    void clear_program();

    [[nodiscard]] ProgramHandle bound_program() const;
    [[nodiscard]] bool is_bound(ProgramHandle program) const;

private:
    ShaderBackend& backend_;
    mutable std::mutex mutex_;
    ProgramHandle bound_ = NULL_HANDLE;
};

}  // namespace prism::graphics
