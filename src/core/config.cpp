// Prism Shader Toolkit Core
// config.cpp - JSON-based configuration system implementation

#include <nlohmann/json.hpp>

#include <prism/core/config.hpp>
#include <prism/core/logger.hpp>
#include <prism/platform/file_io.hpp>

namespace prism::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
    impl_->dirty = false;
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        PRISM_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }
    impl_->path = path;
    PRISM_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            PRISM_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        // Keys absent from the document keep their defaults
        set_defaults();
        impl_->data.merge_patch(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        PRISM_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            PRISM_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        PRISM_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    PRISM_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        PRISM_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        PRISM_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    } else {
        impl_->dirty = false;
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_number_integer()) {
        return value->get<int>();
    }
    return default_value;
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_boolean()) {
        return value->get<bool>();
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_changed(section, key);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_changed(section, key);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
    notify_changed(section, key);
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::SHADERS,
                        {{config_key::ROOT_DIRECTORY, "shaders"},
                         {config_key::PROCESS_INCLUDES, true},
                         {config_key::VALIDATE_PROGRAMS, true}}},
                       {config_section::LOGGING, {{config_key::LEVEL, "info"}}}};
    impl_->dirty = true;
}

void Config::notify_changed(std::string_view section, std::string_view key) {
    impl_->dirty = true;
    if (impl_->change_callback) {
        impl_->change_callback(section, key);
    }
}

}  // namespace prism::core
