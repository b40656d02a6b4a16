// Prism Shader Core
// shader_error.cpp - Typed shader errors

#include <prism/shader/shader_error.hpp>

#include <fmt/format.h>

namespace prism::shader {

namespace {

std::string describe(ShaderErrorKind kind, const std::string& subject, const std::string& detail) {
    switch (kind) {
        case ShaderErrorKind::CompilationFailed:
            return fmt::format("Failed to compile {} shader: {}", subject, detail);
        case ShaderErrorKind::LinkingFailed:
            return fmt::format("Failed to link shader program: {}", detail);
        case ShaderErrorKind::ValidationWarning:
            return fmt::format("Shader program validation warning: {}", detail);
        case ShaderErrorKind::ResourceNotFound:
            return fmt::format("Shader resource not found: {}", subject);
        case ShaderErrorKind::IoError:
            return fmt::format("Failed to read shader '{}': {}", subject, detail);
        case ShaderErrorKind::CyclicInclude:
            return fmt::format("Cyclic #include of '{}'", subject);
        case ShaderErrorKind::InvalidState:
            return fmt::format("Invalid shader state: {}", detail);
        case ShaderErrorKind::UnknownShaderName:
            return fmt::format("Unknown shader: {}", subject);
        default:
            return detail;
    }
}

}  // namespace

const char* shader_error_kind_name(ShaderErrorKind kind) {
    switch (kind) {
        case ShaderErrorKind::CompilationFailed:
            return "CompilationFailed";
        case ShaderErrorKind::LinkingFailed:
            return "LinkingFailed";
        case ShaderErrorKind::ValidationWarning:
            return "ValidationWarning";
        case ShaderErrorKind::ResourceNotFound:
            return "ResourceNotFound";
        case ShaderErrorKind::IoError:
            return "IoError";
        case ShaderErrorKind::CyclicInclude:
            return "CyclicInclude";
        case ShaderErrorKind::InvalidState:
            return "InvalidState";
        case ShaderErrorKind::UnknownShaderName:
            return "UnknownShaderName";
        default:
            return "Unknown";
    }
}

ShaderError::ShaderError(ShaderErrorKind kind, std::string subject, std::string detail)
    : std::runtime_error(describe(kind, subject, detail)),
      kind_(kind),
      subject_(std::move(subject)),
      detail_(std::move(detail)) {}

bool ShaderError::is_backend_error() const noexcept {
    return kind_ == ShaderErrorKind::CompilationFailed || kind_ == ShaderErrorKind::LinkingFailed;
}

ShaderError ShaderError::compilation_failed(std::string_view stage, std::string_view log) {
    return ShaderError(ShaderErrorKind::CompilationFailed, std::string(stage), std::string(log));
}

ShaderError ShaderError::linking_failed(std::string_view log) {
    return ShaderError(ShaderErrorKind::LinkingFailed, {}, std::string(log));
}

ShaderError ShaderError::resource_not_found(std::string_view path) {
    return ShaderError(ShaderErrorKind::ResourceNotFound, std::string(path), {});
}

ShaderError ShaderError::io_error(std::string_view path, std::string_view cause) {
    return ShaderError(ShaderErrorKind::IoError, std::string(path), std::string(cause));
}

ShaderError ShaderError::cyclic_include(std::string_view path) {
    return ShaderError(ShaderErrorKind::CyclicInclude, std::string(path), {});
}

ShaderError ShaderError::invalid_state(std::string_view reason) {
    return ShaderError(ShaderErrorKind::InvalidState, {}, std::string(reason));
}

ShaderError ShaderError::unknown_shader(std::string_view name) {
    return ShaderError(ShaderErrorKind::UnknownShaderName, std::string(name), {});
}

}  // namespace prism::shader
