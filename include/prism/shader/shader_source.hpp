// Prism Shader Core
// shader_source.hpp - Immutable stage source text

#pragma once

#include <prism/graphics/types.hpp>

#include <string>

namespace prism::shader {

// Source text of one stage together with where it came from.
// `path` is used for diagnostics and is empty for inline sources.
class ShaderSource {
public:
    ShaderSource(graphics::StageKind stage, std::string text, std::string path = {})
        : stage_(stage), text_(std::move(text)), path_(std::move(path)) {}

    [[nodiscard]] graphics::StageKind stage() const { return stage_; }
    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] const std::string& path() const { return path_; }

    // Path if known, stage name otherwise
    [[nodiscard]] std::string display_name() const {
        return path_.empty() ? std::string(graphics::stage_name(stage_)) : path_;
    }

private:
    graphics::StageKind stage_;
    std::string text_;
    std::string path_;
};

}  // namespace prism::shader
