// Prism Graphics Layer
// gl_backend.cpp - OpenGL implementation of ShaderBackend

#define GL_GLEXT_PROTOTYPES 1
#include <GL/gl.h>
#include <GL/glext.h>

#include <glm/gtc/type_ptr.hpp>

#include <prism/core/logger.hpp>
#include <prism/graphics/backend.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace prism::graphics {

namespace {

// Driver info logs are read into a buffer of at most this size
constexpr GLsizei MAX_INFO_LOG_LENGTH = 8192;

std::string shader_info_log(GLuint shader) {
    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    if (length <= 0) {
        return {};
    }
    std::vector<GLchar> buffer(static_cast<size_t>(std::min<GLint>(length, MAX_INFO_LOG_LENGTH)));
    GLsizei written = 0;
    glGetShaderInfoLog(shader, static_cast<GLsizei>(buffer.size()), &written, buffer.data());
    return std::string(buffer.data(), static_cast<size_t>(written));
}

std::string program_info_log(GLuint program) {
    GLint length = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    if (length <= 0) {
        return {};
    }
    std::vector<GLchar> buffer(static_cast<size_t>(std::min<GLint>(length, MAX_INFO_LOG_LENGTH)));
    GLsizei written = 0;
    glGetProgramInfoLog(program, static_cast<GLsizei>(buffer.size()), &written, buffer.data());
    return std::string(buffer.data(), static_cast<size_t>(written));
}

std::string gl_string(GLenum name) {
    const GLubyte* value = glGetString(name);
    return value != nullptr ? std::string(reinterpret_cast<const char*>(value)) : std::string();
}

const char* gl_error_name(GLenum error) {
    switch (error) {
        case GL_INVALID_ENUM:
            return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE:
            return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION:
            return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION:
            return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY:
            return "GL_OUT_OF_MEMORY";
        default:
            return "Unknown";
    }
}

}  // namespace

// ============================================================================
// GLShaderBackend
// ============================================================================

class GLShaderBackend final : public ShaderBackend {
public:
    GLShaderBackend() = default;

    ShaderHandle create_shader(StageKind stage) override {
        return glCreateShader(static_cast<GLenum>(stage_backend_type(stage)));
    }

    void shader_source(ShaderHandle shader, std::string_view source) override {
        const GLchar* text = source.data();
        GLint length = static_cast<GLint>(source.size());
        glShaderSource(shader, 1, &text, &length);
    }

    BackendStatus compile_shader(ShaderHandle shader) override {
        glCompileShader(shader);
        GLint status = GL_FALSE;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
        if (status == GL_FALSE) {
            return BackendStatus::failed(shader_info_log(shader));
        }
        return {true, shader_info_log(shader)};
    }

    void delete_shader(ShaderHandle shader) override { glDeleteShader(shader); }

    ProgramHandle create_program() override { return glCreateProgram(); }

    void attach_shader(ProgramHandle program, ShaderHandle shader) override { glAttachShader(program, shader); }

    void detach_shader(ProgramHandle program, ShaderHandle shader) override { glDetachShader(program, shader); }

    void bind_attrib_location(ProgramHandle program, uint32_t index, const std::string& name) override {
        glBindAttribLocation(program, index, name.c_str());
    }

    BackendStatus link_program(ProgramHandle program) override {
        glLinkProgram(program);
        GLint status = GL_FALSE;
        glGetProgramiv(program, GL_LINK_STATUS, &status);
        if (status == GL_FALSE) {
            return BackendStatus::failed(program_info_log(program));
        }
        return {true, program_info_log(program)};
    }

    BackendStatus validate_program(ProgramHandle program) override {
        glValidateProgram(program);
        GLint status = GL_FALSE;
        glGetProgramiv(program, GL_VALIDATE_STATUS, &status);
        if (status == GL_FALSE) {
            return BackendStatus::failed(program_info_log(program));
        }
        return BackendStatus::ok();
    }

    void delete_program(ProgramHandle program) override { glDeleteProgram(program); }

    void use_program(ProgramHandle program) override { glUseProgram(program); }

    int32_t get_uniform_location(ProgramHandle program, const std::string& name) override {
        return glGetUniformLocation(program, name.c_str());
    }

    int32_t get_attrib_location(ProgramHandle program, const std::string& name) override {
        return glGetAttribLocation(program, name.c_str());
    }

    void uniform_int(int32_t location, int32_t value) override { glUniform1i(location, value); }
    void uniform_ivec2(int32_t location, const glm::ivec2& v) override { glUniform2i(location, v.x, v.y); }
    void uniform_ivec3(int32_t location, const glm::ivec3& v) override { glUniform3i(location, v.x, v.y, v.z); }
    void uniform_ivec4(int32_t location, const glm::ivec4& v) override {
        glUniform4i(location, v.x, v.y, v.z, v.w);
    }
    void uniform_float(int32_t location, float value) override { glUniform1f(location, value); }
    void uniform_vec2(int32_t location, const glm::vec2& v) override { glUniform2f(location, v.x, v.y); }
    void uniform_vec3(int32_t location, const glm::vec3& v) override { glUniform3f(location, v.x, v.y, v.z); }
    void uniform_vec4(int32_t location, const glm::vec4& v) override {
        glUniform4f(location, v.x, v.y, v.z, v.w);
    }

    void uniform_mat2(int32_t location, const glm::mat2& m, bool transpose) override {
        glUniformMatrix2fv(location, 1, transpose ? GL_TRUE : GL_FALSE, glm::value_ptr(m));
    }
    void uniform_mat3(int32_t location, const glm::mat3& m, bool transpose) override {
        glUniformMatrix3fv(location, 1, transpose ? GL_TRUE : GL_FALSE, glm::value_ptr(m));
    }
    void uniform_mat4(int32_t location, const glm::mat4& m, bool transpose) override {
        glUniformMatrix4fv(location, 1, transpose ? GL_TRUE : GL_FALSE, glm::value_ptr(m));
    }

    void uniform_float_array(int32_t location, std::span<const float> values) override {
        glUniform1fv(location, static_cast<GLsizei>(values.size()), values.data());
    }
    void uniform_int_array(int32_t location, std::span<const int32_t> values) override {
        glUniform1iv(location, static_cast<GLsizei>(values.size()), values.data());
    }

    DeviceInfo device_info() const override {
        DeviceInfo info;
        info.vendor = gl_string(GL_VENDOR);
        info.renderer = gl_string(GL_RENDERER);
        info.version = gl_string(GL_VERSION);
        info.shading_language_version = gl_string(GL_SHADING_LANGUAGE_VERSION);
        return info;
    }

    const char* get_backend_name() const override { return "OpenGL"; }

    bool check_error(std::string_view operation) override {
        bool clean = true;
        for (GLenum error = glGetError(); error != GL_NO_ERROR; error = glGetError()) {
            PRISM_LOG_ERROR(core::log_category::BACKEND, "OpenGL error during '{}': {} (0x{:x})", operation,
                            gl_error_name(error), error);
            clean = false;
        }
        return clean;
    }
};

std::unique_ptr<ShaderBackend> create_opengl_backend() {
    auto backend = std::make_unique<GLShaderBackend>();
    DeviceInfo info = backend->device_info();
    PRISM_LOG_INFO(core::log_category::BACKEND, "OpenGL backend: {} ({}), GLSL {}", info.renderer, info.version,
                   info.shading_language_version);
    return backend;
}

}  // namespace prism::graphics
