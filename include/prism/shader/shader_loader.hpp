// Prism Shader Core
// shader_loader.hpp - Build programs from readable shader sources

#pragma once

#include "shader_registry.hpp"
#include "shader_source.hpp"

#include <prism/graphics/types.hpp>

#include <memory>
#include <string>
#include <vector>

namespace prism::core {
class Config;
}

namespace prism::graphics {
class GraphicsContext;
}

namespace prism::shader {

class ShaderProgram;
class SourceReader;

struct LoaderOptions {
    std::string root_directory = "shaders";  // Root for a FileSourceReader
    bool process_includes = true;
    bool validate_programs = true;

    // Read the [shaders] section
    [[nodiscard]] static LoaderOptions from_config(const core::Config& config);
};

// Reads stage sources through a SourceReader, expands their includes and
// builds programs from them. The reader and context must outlive the loader
// and every supplier it hands out.
class ShaderLoader {
public:
    ShaderLoader(graphics::GraphicsContext& context, const SourceReader& reader, LoaderOptions options = {});

    // Read (and preprocess, unless disabled) one stage
    [[nodiscard]] ShaderSource read(const std::string& path, graphics::StageKind stage) const;

    // Stage inferred from the extension; InvalidState if it is not a shader extension
    [[nodiscard]] ShaderSource read(const std::string& path) const;

    // `base_path`.vert + `base_path`.frag
    [[nodiscard]] std::unique_ptr<ShaderProgram> load(const std::string& base_path) const;
    [[nodiscard]] std::unique_ptr<ShaderProgram> load(const std::string& vertex_path,
                                                      const std::string& fragment_path) const;

    // Any set of stages, each inferred from its extension
    [[nodiscard]] std::unique_ptr<ShaderProgram> load_stages(const std::vector<std::string>& paths) const;

    // Raw source text, no include processing
    [[nodiscard]] std::unique_ptr<ShaderProgram> from_source(std::string vertex_source,
                                                             std::string fragment_source) const;

    // Registry suppliers that defer the load until first use
    [[nodiscard]] ShaderRegistry::Supplier supplier(const std::string& base_path) const;
    [[nodiscard]] ShaderRegistry::Supplier supplier(std::vector<std::string> paths) const;

    [[nodiscard]] const LoaderOptions& options() const { return options_; }
    [[nodiscard]] const SourceReader& reader() const { return reader_; }

private:
    [[nodiscard]] std::unique_ptr<ShaderProgram> build(std::vector<ShaderSource> sources, std::string label) const;

    graphics::GraphicsContext& context_;
    const SourceReader& reader_;
    LoaderOptions options_;
};

}  // namespace prism::shader
