// Prism Shader Core
// shader_program.hpp - Linked shader programs and their builder

#pragma once

#include "shader_source.hpp"
#include "uniform_cache.hpp"

#include <prism/graphics/types.hpp>

#include <glm/glm.hpp>

#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace prism::graphics {
class GraphicsContext;
class ShaderBackend;
}  // namespace prism::graphics

namespace prism::shader {

class CompiledStage;

// ============================================================================
// Shader Program
// ============================================================================

// A linked program together with the compiled stages it owns.
//
// Programs are created only by Builder::build() and are always linked when
// handed out. Binding goes through the owning GraphicsContext, which skips
// activation calls for a program that is already active. A disposed program
// can not be bound again.
class ShaderProgram {
public:
    // ========================================================================
    // Builder
    // ========================================================================

    // Accumulates stage sources (already preprocessed) and link options.
    class Builder {
    public:
        explicit Builder(graphics::GraphicsContext& context);

        Builder& vertex(std::string source);
        Builder& fragment(std::string source);
        Builder& geometry(std::string source);
        Builder& tess_control(std::string source);
        Builder& tess_evaluation(std::string source);
        Builder& compute(std::string source);
        Builder& stage(graphics::StageKind kind, std::string source);
        Builder& stage(ShaderSource source);

        // Name used in log output
        Builder& label(std::string name);

        // Bound before linking
        Builder& attribute_location(uint32_t index, std::string name);

        // Run post-link validation (default on). Validation failures are
        // logged and kept in validation_log(), never raised.
        Builder& validate(bool enabled);

        [[nodiscard]] size_t stage_count() const { return sources_.size(); }

        // Compile every stage, attach, link and validate.
        // Throws ShaderError: InvalidState (no stages, checked before any
        // backend call), CompilationFailed, LinkingFailed. Every backend
        // object created by a failed build is released before the throw.
        [[nodiscard]] std::unique_ptr<ShaderProgram> build() const;

    private:
        graphics::GraphicsContext& context_;
        std::vector<ShaderSource> sources_;
        std::vector<std::pair<uint32_t, std::string>> attribute_locations_;
        std::string label_;
        bool validate_ = true;
    };

    // Vertex + fragment shortcut
    [[nodiscard]] static std::unique_ptr<ShaderProgram> create(graphics::GraphicsContext& context,
                                                               std::string vertex_source,
                                                               std::string fragment_source);

    ~ShaderProgram();

    // Non-copyable, non-movable (the uniform cache and context refer to this handle)
    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;
    ShaderProgram(ShaderProgram&&) = delete;
    ShaderProgram& operator=(ShaderProgram&&) = delete;

    // ========================================================================
    // Binding
    // ========================================================================

    // Throws ShaderError::InvalidState if disposed
    void bind();

    // No-op unless this program is the active one
    void unbind();

    [[nodiscard]] bool is_bound() const;

    // Bind and run fn(*this)
    template <typename Fn>
    decltype(auto) use(Fn&& fn) {
        bind();
        return std::forward<Fn>(fn)(*this);
    }

    // Bind, run fn(*this), unbind on every exit path
    template <typename Fn>
    decltype(auto) use_and_unbind(Fn&& fn) {
        bind();
        UnbindGuard guard{*this};
        return std::forward<Fn>(fn)(*this);
    }

    // ========================================================================
    // Uniforms
    // ========================================================================
    // Setters bind the program first (a no-op when it is already active) and
    // skip the upload for names the program does not declare. All of them
    // throw ShaderError::InvalidState on a disposed program.

    void set_uniform(const std::string& name, int32_t value);
    void set_uniform(const std::string& name, float value);
    void set_uniform(const std::string& name, bool value);
    void set_uniform(const std::string& name, const glm::ivec2& value);
    void set_uniform(const std::string& name, const glm::ivec3& value);
    void set_uniform(const std::string& name, const glm::ivec4& value);
    void set_uniform(const std::string& name, const glm::vec2& value);
    void set_uniform(const std::string& name, const glm::vec3& value);
    void set_uniform(const std::string& name, const glm::vec4& value);
    void set_uniform(const std::string& name, const glm::mat2& value, bool transpose = false);
    void set_uniform(const std::string& name, const glm::mat3& value, bool transpose = false);
    void set_uniform(const std::string& name, const glm::mat4& value, bool transpose = false);
    void set_uniform(const std::string& name, std::span<const float> values);
    void set_uniform(const std::string& name, std::span<const int32_t> values);

    // Returns false if the program has no such uniform
    bool set_uniform_if_exists(const std::string& name, float value);

    // Point a sampler uniform at a texture unit
    void set_sampler(const std::string& name, int32_t unit);

    [[nodiscard]] int32_t uniform_location(const std::string& name);
    [[nodiscard]] bool has_uniform(const std::string& name);

    // ========================================================================
    // Attributes
    // ========================================================================

    [[nodiscard]] int32_t attribute_location(const std::string& name) const;

    // Takes effect at the next relink()
    void bind_attribute_location(uint32_t index, const std::string& name);

    // Link again and drop cached uniform locations. A failed relink disposes
    // the program and throws ShaderError::LinkingFailed.
    void relink();

    // ========================================================================
    // Lifetime
    // ========================================================================

    // Unbind if active, detach and delete every stage, delete the program.
    // Idempotent.
    void dispose();
    void close() { dispose(); }

    [[nodiscard]] bool is_disposed() const { return disposed_; }
    [[nodiscard]] graphics::ProgramHandle handle() const { return handle_; }
    [[nodiscard]] const std::string& label() const { return label_; }
    [[nodiscard]] size_t stage_count() const { return stages_.size(); }
    [[nodiscard]] bool has_stage(graphics::StageKind kind) const;

    // Log of the last failed validation, empty if validation passed or was off
    [[nodiscard]] const std::string& validation_log() const { return validation_log_; }

    [[nodiscard]] graphics::GraphicsContext& context() const { return context_; }

private:
    struct UnbindGuard {
        ShaderProgram& program;
        ~UnbindGuard() { program.unbind(); }
    };

    ShaderProgram(graphics::GraphicsContext& context, graphics::ProgramHandle handle,
                  std::vector<std::unique_ptr<CompiledStage>> stages, std::string label, bool validate);

    [[nodiscard]] graphics::ShaderBackend& backend() const;
    void require_live(const char* operation) const;

    // Bind and resolve `name`; INVALID_LOCATION means skip the upload
    int32_t prepare_upload(const std::string& name);

    void run_validation();

    graphics::GraphicsContext& context_;
    graphics::ProgramHandle handle_;
    std::vector<std::unique_ptr<CompiledStage>> stages_;
    UniformCache uniforms_;
    std::string label_;
    std::string validation_log_;
    bool validate_;
    bool disposed_ = false;
};

}  // namespace prism::shader
