// Prism Graphics Layer
// types.hpp - Handles, shader stages and stage metadata

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace prism::graphics {

// ============================================================================
// Backend Handles
// ============================================================================

using ShaderHandle = uint32_t;
using ProgramHandle = uint32_t;

// Handle value the backend never hands out ("no object" / "no program bound")
inline constexpr uint32_t NULL_HANDLE = 0;

// Location returned for uniforms and attributes that are absent or inactive
inline constexpr int32_t INVALID_LOCATION = -1;

// ============================================================================
// Shader Stages
// ============================================================================

enum class StageKind : uint8_t {
    Vertex,
    Fragment,
    Geometry,
    TessControl,
    TessEvaluation,
    Compute,
};

inline constexpr size_t STAGE_KIND_COUNT = 6;

// Static description of one stage
struct StageInfo {
    StageKind kind;
    uint32_t backend_type;  // OpenGL shader type enum
    const char* extension;  // Canonical file extension, no leading dot
    const char* name;       // Display name for diagnostics
};

inline constexpr std::array<StageInfo, STAGE_KIND_COUNT> STAGE_TABLE = {{
    {StageKind::Vertex, 0x8B31, "vert", "vertex"},
    {StageKind::Fragment, 0x8B30, "frag", "fragment"},
    {StageKind::Geometry, 0x8DD9, "geom", "geometry"},
    {StageKind::TessControl, 0x8E88, "tesc", "tess_control"},
    {StageKind::TessEvaluation, 0x8E87, "tese", "tess_evaluation"},
    {StageKind::Compute, 0x91B9, "comp", "compute"},
}};

[[nodiscard]] constexpr const StageInfo& stage_info(StageKind stage) {
    return STAGE_TABLE[static_cast<size_t>(stage)];
}

[[nodiscard]] constexpr uint32_t stage_backend_type(StageKind stage) {
    return stage_info(stage).backend_type;
}

[[nodiscard]] constexpr const char* stage_extension(StageKind stage) {
    return stage_info(stage).extension;
}

[[nodiscard]] constexpr const char* stage_name(StageKind stage) {
    return stage_info(stage).name;
}

// Determine stage from a file extension, with or without leading dot.
// Accepts canonical extensions and the aliases vs/vsh, fs/fsh/ps, gs/gsh, cs/csh.
[[nodiscard]] std::optional<StageKind> stage_from_extension(std::string_view extension);

// Determine stage from the extension of a path ("lighting/sky.frag")
[[nodiscard]] std::optional<StageKind> stage_from_path(std::string_view path);

// ============================================================================
// Device Info
// ============================================================================

struct DeviceInfo {
    std::string vendor;
    std::string renderer;
    std::string version;
    std::string shading_language_version;
};

}  // namespace prism::graphics
