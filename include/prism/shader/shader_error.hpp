// Prism Shader Core
// shader_error.hpp - Typed shader errors

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace prism::shader {

enum class ShaderErrorKind : uint8_t {
    CompilationFailed,   // Stage compile failure (subject: stage name, detail: compiler log)
    LinkingFailed,       // Program creation or link failure (detail: linker log)
    ValidationWarning,   // Post-link validation; logged, never thrown
    ResourceNotFound,    // Source path does not exist (subject: path)
    IoError,             // Source could not be read (subject: path, detail: cause)
    CyclicInclude,       // Include chain revisits a file (subject: path)
    InvalidState,        // Usage error, e.g. building with no stages
    UnknownShaderName,   // Registry lookup miss (subject: name)
};

[[nodiscard]] const char* shader_error_kind_name(ShaderErrorKind kind);

// Caller-facing error for every failure in the shader core
class ShaderError : public std::runtime_error {
public:
    ShaderError(ShaderErrorKind kind, std::string subject, std::string detail);

    [[nodiscard]] ShaderErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    // True for failures reported by the graphics backend rather than by the caller
    [[nodiscard]] bool is_backend_error() const noexcept;

    [[nodiscard]] static ShaderError compilation_failed(std::string_view stage, std::string_view log);
    [[nodiscard]] static ShaderError linking_failed(std::string_view log);
    [[nodiscard]] static ShaderError resource_not_found(std::string_view path);
    [[nodiscard]] static ShaderError io_error(std::string_view path, std::string_view cause);
    [[nodiscard]] static ShaderError cyclic_include(std::string_view path);
    [[nodiscard]] static ShaderError invalid_state(std::string_view reason);
    [[nodiscard]] static ShaderError unknown_shader(std::string_view name);

private:
    ShaderErrorKind kind_;
    std::string subject_;
    std::string detail_;
};

}  // namespace prism::shader
