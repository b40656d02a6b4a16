// Prism Shader Core
// shader_manifest.cpp - JSON list of named shaders for bulk registration

#include <nlohmann/json.hpp>

#include <prism/core/logger.hpp>
#include <prism/graphics/types.hpp>
#include <prism/platform/file_io.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/shader_loader.hpp>
#include <prism/shader/shader_manifest.hpp>

#include <fmt/format.h>

namespace prism::shader {

using json = nlohmann::json;

namespace {

ManifestEntry parse_entry(const std::string& name, const json& value) {
    ManifestEntry entry;
    entry.name = name;

    if (value.is_string()) {
        entry.base_path = value.get<std::string>();
        if (entry.base_path.empty()) {
            throw ShaderError::invalid_state(fmt::format("manifest entry '{}' has an empty path", name));
        }
        return entry;
    }

    if (!value.is_array() || value.empty()) {
        throw ShaderError::invalid_state(
            fmt::format("manifest entry '{}' must be a base path or a non-empty list of stage files", name));
    }

    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ShaderError::invalid_state(fmt::format("manifest entry '{}' lists a non-string stage", name));
        }
        auto path = item.get<std::string>();
        if (!graphics::stage_from_path(path)) {
            throw ShaderError::invalid_state(
                fmt::format("manifest entry '{}': cannot infer shader stage from '{}'", name, path));
        }
        entry.stage_paths.push_back(std::move(path));
    }
    return entry;
}

}  // namespace

ShaderManifest ShaderManifest::parse(std::string_view text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ShaderError::invalid_state(fmt::format("malformed shader manifest: {}", e.what()));
    }

    if (!document.is_object()) {
        throw ShaderError::invalid_state("shader manifest root must be a JSON object");
    }

    ShaderManifest manifest;
    auto shaders = document.find("shaders");
    if (shaders == document.end()) {
        return manifest;
    }
    if (!shaders->is_object()) {
        throw ShaderError::invalid_state("shader manifest 'shaders' must be a JSON object");
    }

    // nlohmann::json objects iterate in key order
    for (auto it = shaders->begin(); it != shaders->end(); ++it) {
        manifest.entries_.push_back(parse_entry(it.key(), it.value()));
    }
    return manifest;
}

ShaderManifest ShaderManifest::load(const std::filesystem::path& path) {
    if (!platform::FileSystem::exists(path)) {
        throw ShaderError::resource_not_found(path.string());
    }
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        throw ShaderError::io_error(path.string(), "read failed");
    }

    auto manifest = parse(*content);
    PRISM_LOG_INFO(core::log_category::REGISTRY, "Loaded shader manifest {} ({} entries)", path.string(),
                   manifest.entries_.size());
    return manifest;
}

size_t ShaderManifest::register_all(ShaderRegistry& registry, const ShaderLoader& loader) const {
    for (const auto& entry : entries_) {
        if (entry.is_pair()) {
            registry.register_shader(entry.name, loader.supplier(entry.base_path));
        } else {
            registry.register_shader(entry.name, loader.supplier(entry.stage_paths));
        }
    }
    return entries_.size();
}

}  // namespace prism::shader
