// Prism Graphics Layer
// types.cpp - Stage lookup helpers

#include <prism/graphics/types.hpp>

namespace prism::graphics {

namespace {

struct StageAlias {
    std::string_view extension;
    StageKind kind;
};

constexpr std::array<StageAlias, 9> STAGE_ALIASES = {{
    {"vs", StageKind::Vertex},
    {"vsh", StageKind::Vertex},
    {"fs", StageKind::Fragment},
    {"fsh", StageKind::Fragment},
    {"ps", StageKind::Fragment},
    {"gs", StageKind::Geometry},
    {"gsh", StageKind::Geometry},
    {"cs", StageKind::Compute},
    {"csh", StageKind::Compute},
}};

}  // namespace

std::optional<StageKind> stage_from_extension(std::string_view extension) {
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    if (extension.empty()) {
        return std::nullopt;
    }

    for (const auto& info : STAGE_TABLE) {
        if (extension == info.extension) {
            return info.kind;
        }
    }
    for (const auto& alias : STAGE_ALIASES) {
        if (extension == alias.extension) {
            return alias.kind;
        }
    }
    return std::nullopt;
}

std::optional<StageKind> stage_from_path(std::string_view path) {
    size_t separator = path.find_last_of("/\\");
    std::string_view filename = separator == std::string_view::npos ? path : path.substr(separator + 1);

    size_t dot = filename.find_last_of('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }
    return stage_from_extension(filename.substr(dot + 1));
}

}  // namespace prism::graphics
