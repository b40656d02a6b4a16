// Prism Graphics Layer
// backend.hpp - Graphics API interface consumed by the shader core

#pragma once

#include "types.hpp"

#include <glm/glm.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace prism::graphics {

// Outcome of a compile, link or validate call
struct BackendStatus {
    bool success = false;
    std::string log;  // Driver diagnostic output, may be empty on success

    [[nodiscard]] static BackendStatus ok() { return {true, {}}; }
    [[nodiscard]] static BackendStatus failed(std::string log) { return {false, std::move(log)}; }
};

// Abstract shader backend.
// All calls must be made on the thread that owns the backend's context.
// Implementations: GLShaderBackend (create_opengl_backend), test doubles
class ShaderBackend {
public:
    virtual ~ShaderBackend() = default;

    // Non-copyable
    ShaderBackend(const ShaderBackend&) = delete;
    ShaderBackend& operator=(const ShaderBackend&) = delete;

    // ========================================================================
    // Shader Objects
    // ========================================================================

    // Returns NULL_HANDLE if the object could not be created
    [[nodiscard]] virtual ShaderHandle create_shader(StageKind stage) = 0;
    virtual void shader_source(ShaderHandle shader, std::string_view source) = 0;
    [[nodiscard]] virtual BackendStatus compile_shader(ShaderHandle shader) = 0;
    virtual void delete_shader(ShaderHandle shader) = 0;

    // ========================================================================
    // Program Objects
    // ========================================================================

    // Returns NULL_HANDLE if the object could not be created
    [[nodiscard]] virtual ProgramHandle create_program() = 0;
    virtual void attach_shader(ProgramHandle program, ShaderHandle shader) = 0;
    virtual void detach_shader(ProgramHandle program, ShaderHandle shader) = 0;
    virtual void bind_attrib_location(ProgramHandle program, uint32_t index, const std::string& name) = 0;
    [[nodiscard]] virtual BackendStatus link_program(ProgramHandle program) = 0;
    [[nodiscard]] virtual BackendStatus validate_program(ProgramHandle program) = 0;
    virtual void delete_program(ProgramHandle program) = 0;

    // NULL_HANDLE deactivates the current program
    virtual void use_program(ProgramHandle program) = 0;

    // ========================================================================
    // Reflection
    // ========================================================================

    [[nodiscard]] virtual int32_t get_uniform_location(ProgramHandle program, const std::string& name) = 0;
    [[nodiscard]] virtual int32_t get_attrib_location(ProgramHandle program, const std::string& name) = 0;

    // ========================================================================
    // Uniform Upload (applies to the currently active program)
    // ========================================================================

    virtual void uniform_int(int32_t location, int32_t value) = 0;
    virtual void uniform_ivec2(int32_t location, const glm::ivec2& value) = 0;
    virtual void uniform_ivec3(int32_t location, const glm::ivec3& value) = 0;
    virtual void uniform_ivec4(int32_t location, const glm::ivec4& value) = 0;
    virtual void uniform_float(int32_t location, float value) = 0;
    virtual void uniform_vec2(int32_t location, const glm::vec2& value) = 0;
    virtual void uniform_vec3(int32_t location, const glm::vec3& value) = 0;
    virtual void uniform_vec4(int32_t location, const glm::vec4& value) = 0;
    virtual void uniform_mat2(int32_t location, const glm::mat2& value, bool transpose) = 0;
    virtual void uniform_mat3(int32_t location, const glm::mat3& value, bool transpose) = 0;
    virtual void uniform_mat4(int32_t location, const glm::mat4& value, bool transpose) = 0;
    virtual void uniform_float_array(int32_t location, std::span<const float> values) = 0;
    virtual void uniform_int_array(int32_t location, std::span<const int32_t> values) = 0;

    // ========================================================================
    // Diagnostics
    // ========================================================================

    [[nodiscard]] virtual DeviceInfo device_info() const = 0;
    [[nodiscard]] virtual const char* get_backend_name() const = 0;

    // Logs and returns false if the API reported an error since the last check
    virtual bool check_error(std::string_view operation) = 0;

protected:
    ShaderBackend() = default;
};

// OpenGL 4.3 backend. A GL context must be current on the calling thread
// for the lifetime of the returned object.
[[nodiscard]] std::unique_ptr<ShaderBackend> create_opengl_backend();

}  // namespace prism::graphics
