// Prism Shader Core
// shader_program.cpp - Linked shader programs and their builder

#include <prism/core/logger.hpp>
#include <prism/graphics/backend.hpp>
#include <prism/graphics/context.hpp>
#include <prism/shader/compiled_stage.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/shader_program.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace prism::shader {

namespace {

std::string describe(const std::string& label, graphics::ProgramHandle handle) {
    return label.empty() ? fmt::format("program {}", handle) : fmt::format("'{}' (program {})", label, handle);
}

void release_stages(graphics::ShaderBackend& backend, graphics::ProgramHandle program,
                    std::vector<std::unique_ptr<CompiledStage>>& stages) {
    for (auto& stage : stages) {
        if (!stage->is_disposed()) {
            backend.detach_shader(program, stage->handle());
            stage->dispose();
        }
    }
    stages.clear();
}

}  // namespace

// ============================================================================
// Builder
// ============================================================================

ShaderProgram::Builder::Builder(graphics::GraphicsContext& context) : context_(context) {}

ShaderProgram::Builder& ShaderProgram::Builder::vertex(std::string source) {
    return stage(graphics::StageKind::Vertex, std::move(source));
}

ShaderProgram::Builder& ShaderProgram::Builder::fragment(std::string source) {
    return stage(graphics::StageKind::Fragment, std::move(source));
}

ShaderProgram::Builder& ShaderProgram::Builder::geometry(std::string source) {
    return stage(graphics::StageKind::Geometry, std::move(source));
}

ShaderProgram::Builder& ShaderProgram::Builder::tess_control(std::string source) {
    return stage(graphics::StageKind::TessControl, std::move(source));
}

ShaderProgram::Builder& ShaderProgram::Builder::tess_evaluation(std::string source) {
    return stage(graphics::StageKind::TessEvaluation, std::move(source));
}

ShaderProgram::Builder& ShaderProgram::Builder::compute(std::string source) {
    return stage(graphics::StageKind::Compute, std::move(source));
}

ShaderProgram::Builder& ShaderProgram::Builder::stage(graphics::StageKind kind, std::string source) {
    sources_.emplace_back(kind, std::move(source));
    return *this;
}

ShaderProgram::Builder& ShaderProgram::Builder::stage(ShaderSource source) {
    sources_.push_back(std::move(source));
    return *this;
}

ShaderProgram::Builder& ShaderProgram::Builder::label(std::string name) {
    label_ = std::move(name);
    return *this;
}

ShaderProgram::Builder& ShaderProgram::Builder::attribute_location(uint32_t index, std::string name) {
    attribute_locations_.emplace_back(index, std::move(name));
    return *this;
}

ShaderProgram::Builder& ShaderProgram::Builder::validate(bool enabled) {
    validate_ = enabled;
    return *this;
}

std::unique_ptr<ShaderProgram> ShaderProgram::Builder::build() const {
    if (sources_.empty()) {
        throw ShaderError::invalid_state("cannot build a program with no shader stages");
    }

    auto& backend = context_.backend();

    // Stages compiled so far are released by their destructors if a later
    // stage fails
    std::vector<std::unique_ptr<CompiledStage>> stages;
    stages.reserve(sources_.size());
    for (const auto& source : sources_) {
        stages.push_back(CompiledStage::compile(backend, source));
    }

    graphics::ProgramHandle program = backend.create_program();
    if (program == graphics::NULL_HANDLE) {
        PRISM_LOG_ERROR(core::log_category::SHADER, "Failed to create program object for {}",
                        label_.empty() ? "unnamed program" : label_);
        throw ShaderError::linking_failed("failed to create program object");
    }

    for (const auto& stage : stages) {
        backend.attach_shader(program, stage->handle());
    }
    for (const auto& [index, name] : attribute_locations_) {
        backend.bind_attrib_location(program, index, name);
    }

    auto status = backend.link_program(program);
    if (!status.success) {
        release_stages(backend, program, stages);
        backend.delete_program(program);
        PRISM_LOG_ERROR(core::log_category::SHADER, "Failed to link {}:\n{}", describe(label_, program), status.log);
        throw ShaderError::linking_failed(status.log);
    }

    auto result = std::unique_ptr<ShaderProgram>(
        new ShaderProgram(context_, program, std::move(stages), label_, validate_));
    result->run_validation();

    PRISM_LOG_DEBUG(core::log_category::SHADER, "Linked {} with {} stage(s)", describe(label_, program),
                    result->stage_count());
    return result;
}

// ============================================================================
// ShaderProgram
// ============================================================================

std::unique_ptr<ShaderProgram> ShaderProgram::create(graphics::GraphicsContext& context, std::string vertex_source,
                                                     std::string fragment_source) {
    return Builder(context).vertex(std::move(vertex_source)).fragment(std::move(fragment_source)).build();
}

ShaderProgram::ShaderProgram(graphics::GraphicsContext& context, graphics::ProgramHandle handle,
                             std::vector<std::unique_ptr<CompiledStage>> stages, std::string label, bool validate)
    : context_(context),
      handle_(handle),
      stages_(std::move(stages)),
      uniforms_(context.backend(), handle),
      label_(std::move(label)),
      validate_(validate) {}

ShaderProgram::~ShaderProgram() {
    dispose();
}

graphics::ShaderBackend& ShaderProgram::backend() const {
    return context_.backend();
}

void ShaderProgram::require_live(const char* operation) const {
    if (disposed_) {
        throw ShaderError::invalid_state(fmt::format("{} on disposed {}", operation, describe(label_, handle_)));
    }
}

void ShaderProgram::run_validation() {
    validation_log_.clear();

    // API errors raised while linking are reported here, not thrown
    if (!backend().check_error(fmt::format("link {}", describe(label_, handle_)))) {
        validation_log_ = "backend reported an API error while linking";
    }
    if (!validate_) {
        return;
    }
    auto status = backend().validate_program(handle_);
    if (!status.success) {
        if (!validation_log_.empty()) {
            validation_log_ += '\n';
        }
        validation_log_ += status.log;
        PRISM_LOG_WARN(core::log_category::SHADER, "Validation of {} reported: {}", describe(label_, handle_),
                       status.log);
    }
}

// ----------------------------------------------------------------------------
// Binding
// ----------------------------------------------------------------------------

void ShaderProgram::bind() {
    require_live("bind");
    context_.use_program(handle_);
}

void ShaderProgram::unbind() {
    if (disposed_) {
        return;
    }
    context_.release_program(handle_);
}

bool ShaderProgram::is_bound() const {
    return !disposed_ && context_.is_bound(handle_);
}

// ----------------------------------------------------------------------------
// Uniforms
// ----------------------------------------------------------------------------

int32_t ShaderProgram::prepare_upload(const std::string& name) {
    require_live("set_uniform");
    int32_t location = uniforms_.location(name);
    if (location != graphics::INVALID_LOCATION) {
        context_.use_program(handle_);
    }
    return location;
}

void ShaderProgram::set_uniform(const std::string& name, int32_t value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_int(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, float value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_float(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, bool value) {
    set_uniform(name, static_cast<int32_t>(value ? 1 : 0));
}

void ShaderProgram::set_uniform(const std::string& name, const glm::ivec2& value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_ivec2(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::ivec3& value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_ivec3(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::ivec4& value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_ivec4(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::vec2& value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_vec2(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::vec3& value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_vec3(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::vec4& value) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_vec4(loc, value);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::mat2& value, bool transpose) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_mat2(loc, value, transpose);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::mat3& value, bool transpose) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_mat3(loc, value, transpose);
    }
}

void ShaderProgram::set_uniform(const std::string& name, const glm::mat4& value, bool transpose) {
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_mat4(loc, value, transpose);
    }
}

void ShaderProgram::set_uniform(const std::string& name, std::span<const float> values) {
    if (values.empty()) {
        return;
    }
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_float_array(loc, values);
    }
}

void ShaderProgram::set_uniform(const std::string& name, std::span<const int32_t> values) {
    if (values.empty()) {
        return;
    }
    if (int32_t loc = prepare_upload(name); loc != graphics::INVALID_LOCATION) {
        backend().uniform_int_array(loc, values);
    }
}

bool ShaderProgram::set_uniform_if_exists(const std::string& name, float value) {
    int32_t loc = prepare_upload(name);
    if (loc == graphics::INVALID_LOCATION) {
        return false;
    }
    backend().uniform_float(loc, value);
    return true;
}

void ShaderProgram::set_sampler(const std::string& name, int32_t unit) {
    set_uniform(name, unit);
}

int32_t ShaderProgram::uniform_location(const std::string& name) {
    require_live("uniform_location");
    return uniforms_.location(name);
}

bool ShaderProgram::has_uniform(const std::string& name) {
    require_live("has_uniform");
    return uniforms_.exists(name);
}

// ----------------------------------------------------------------------------
// Attributes
// ----------------------------------------------------------------------------

int32_t ShaderProgram::attribute_location(const std::string& name) const {
    require_live("attribute_location");
    int32_t location = backend().get_attrib_location(handle_, name);
    return location < 0 ? graphics::INVALID_LOCATION : location;
}

void ShaderProgram::bind_attribute_location(uint32_t index, const std::string& name) {
    require_live("bind_attribute_location");
    backend().bind_attrib_location(handle_, index, name);
}

void ShaderProgram::relink() {
    require_live("relink");

    auto status = backend().link_program(handle_);
    uniforms_.invalidate();
    if (!status.success) {
        PRISM_LOG_ERROR(core::log_category::SHADER, "Failed to relink {}:\n{}", describe(label_, handle_),
                        status.log);
        dispose();
        throw ShaderError::linking_failed(status.log);
    }

    run_validation();
    PRISM_LOG_DEBUG(core::log_category::SHADER, "Relinked {}", describe(label_, handle_));
}

// ----------------------------------------------------------------------------
// Lifetime
// ----------------------------------------------------------------------------

void ShaderProgram::dispose() {
    if (disposed_) {
        return;
    }

    context_.release_program(handle_);
    release_stages(backend(), handle_, stages_);
    backend().delete_program(handle_);
    uniforms_.invalidate();
    disposed_ = true;

    PRISM_LOG_TRACE(core::log_category::SHADER, "Disposed {}", describe(label_, handle_));
}

bool ShaderProgram::has_stage(graphics::StageKind kind) const {
    return std::any_of(stages_.begin(), stages_.end(),
                       [kind](const std::unique_ptr<CompiledStage>& stage) { return stage->stage() == kind; });
}

}  // namespace prism::shader
