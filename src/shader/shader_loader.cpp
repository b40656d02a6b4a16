// Prism Shader Core
// shader_loader.cpp - Build programs from readable shader sources

#include <prism/core/config.hpp>
#include <prism/core/logger.hpp>
#include <prism/shader/preprocessor.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/shader_loader.hpp>
#include <prism/shader/shader_program.hpp>
#include <prism/shader/source_reader.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace prism::shader {

LoaderOptions LoaderOptions::from_config(const core::Config& config) {
    LoaderOptions options;
    options.root_directory =
        config.get_string(core::config_section::SHADERS, core::config_key::ROOT_DIRECTORY, options.root_directory);
    options.process_includes =
        config.get_bool(core::config_section::SHADERS, core::config_key::PROCESS_INCLUDES, options.process_includes);
    options.validate_programs = config.get_bool(core::config_section::SHADERS, core::config_key::VALIDATE_PROGRAMS,
                                                options.validate_programs);
    return options;
}

ShaderLoader::ShaderLoader(graphics::GraphicsContext& context, const SourceReader& reader, LoaderOptions options)
    : context_(context), reader_(reader), options_(std::move(options)) {}

ShaderSource ShaderLoader::read(const std::string& path, graphics::StageKind stage) const {
    std::string text;
    if (options_.process_includes) {
        text = SourcePreprocessor(reader_).process_file(path);
    } else {
        text = reader_.read_text(path);
    }
    PRISM_LOG_TRACE(core::log_category::IO, "Loaded {} source {} ({} bytes)", graphics::stage_name(stage), path,
                    text.size());
    return ShaderSource(stage, std::move(text), path);
}

ShaderSource ShaderLoader::read(const std::string& path) const {
    auto stage = graphics::stage_from_path(path);
    if (!stage) {
        throw ShaderError::invalid_state(fmt::format("cannot infer shader stage from '{}'", path));
    }
    return read(path, *stage);
}

std::unique_ptr<ShaderProgram> ShaderLoader::load(const std::string& base_path) const {
    std::vector<ShaderSource> sources;
    sources.push_back(read(base_path + "." + graphics::stage_extension(graphics::StageKind::Vertex),
                           graphics::StageKind::Vertex));
    sources.push_back(read(base_path + "." + graphics::stage_extension(graphics::StageKind::Fragment),
                           graphics::StageKind::Fragment));
    return build(std::move(sources), base_path);
}

std::unique_ptr<ShaderProgram> ShaderLoader::load(const std::string& vertex_path,
                                                  const std::string& fragment_path) const {
    std::vector<ShaderSource> sources;
    sources.push_back(read(vertex_path, graphics::StageKind::Vertex));
    sources.push_back(read(fragment_path, graphics::StageKind::Fragment));
    return build(std::move(sources), vertex_path);
}

std::unique_ptr<ShaderProgram> ShaderLoader::load_stages(const std::vector<std::string>& paths) const {
    std::vector<ShaderSource> sources;
    sources.reserve(paths.size());
    for (const auto& path : paths) {
        sources.push_back(read(path));
    }
    return build(std::move(sources), fmt::format("{}", fmt::join(paths, ", ")));
}

std::unique_ptr<ShaderProgram> ShaderLoader::from_source(std::string vertex_source,
                                                         std::string fragment_source) const {
    std::vector<ShaderSource> sources;
    sources.emplace_back(graphics::StageKind::Vertex, std::move(vertex_source));
    sources.emplace_back(graphics::StageKind::Fragment, std::move(fragment_source));
    return build(std::move(sources), {});
}

ShaderRegistry::Supplier ShaderLoader::supplier(const std::string& base_path) const {
    return [this, base_path]() { return load(base_path); };
}

ShaderRegistry::Supplier ShaderLoader::supplier(std::vector<std::string> paths) const {
    return [this, paths = std::move(paths)]() { return load_stages(paths); };
}

std::unique_ptr<ShaderProgram> ShaderLoader::build(std::vector<ShaderSource> sources, std::string label) const {
    ShaderProgram::Builder builder(context_);
    for (auto& source : sources) {
        builder.stage(std::move(source));
    }
    return builder.label(std::move(label)).validate(options_.validate_programs).build();
}

}  // namespace prism::shader
