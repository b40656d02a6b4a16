// Prism Shader Core
// shader_registry.cpp - Named, lazily materialized shader programs

#include <prism/core/logger.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/shader_program.hpp>
#include <prism/shader/shader_registry.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace prism::shader {

namespace {

void dispose_all(std::vector<std::shared_ptr<ShaderProgram>>& programs) {
    for (auto& program : programs) {
        program->dispose();
    }
    programs.clear();
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct ShaderRegistry::Impl {
    struct Entry {
        Supplier supplier;
        std::shared_ptr<ShaderProgram> program;

        // Serializes materialization of this one entry
        std::shared_ptr<std::mutex> load_mutex = std::make_shared<std::mutex>();

        // Bumped whenever an in-flight materialization must not be cached
        uint64_t generation = 0;
    };

    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    uint64_t next_generation = 1;

    // Programs replaced by register_shader() or add(). Those may run off the
    // context thread, so disposal waits for the next get/reload/remove/dispose.
    std::vector<std::shared_ptr<ShaderProgram>> retired;

    // Requires `mutex`
    void invalidate(Entry& entry) { entry.generation = next_generation++; }

    // Requires `mutex`
    void retire(std::shared_ptr<ShaderProgram> program) {
        if (program) {
            retired.push_back(std::move(program));
        }
    }

    // Requires `mutex`
    void take_retired(std::vector<std::shared_ptr<ShaderProgram>>& out) {
        for (auto& program : retired) {
            out.push_back(std::move(program));
        }
        retired.clear();
    }

    void dispose_retired() {
        std::vector<std::shared_ptr<ShaderProgram>> programs;
        {
            std::lock_guard lock(mutex);
            if (retired.empty()) {
                return;
            }
            take_retired(programs);
        }
        PRISM_LOG_DEBUG(core::log_category::REGISTRY, "Disposing {} replaced shader(s)", programs.size());
        dispose_all(programs);
    }
};

ShaderRegistry::ShaderRegistry() : impl_(std::make_unique<Impl>()) {}

ShaderRegistry::~ShaderRegistry() {
    dispose();
}

void ShaderRegistry::register_shader(const std::string& name, Supplier supplier) {
    if (!supplier) {
        throw ShaderError::invalid_state(fmt::format("empty supplier registered for '{}'", name));
    }

    bool replaced = false;
    {
        std::lock_guard lock(impl_->mutex);
        auto& entry = impl_->entries[name];
        entry.supplier = std::move(supplier);
        replaced = entry.program != nullptr;
        impl_->retire(std::move(entry.program));
        entry.program.reset();
        impl_->invalidate(entry);
    }

    if (replaced) {
        PRISM_LOG_DEBUG(core::log_category::REGISTRY, "Replaced shader '{}'", name);
    } else {
        PRISM_LOG_DEBUG(core::log_category::REGISTRY, "Registered shader '{}'", name);
    }
}

void ShaderRegistry::add(const std::string& name, std::unique_ptr<ShaderProgram> program) {
    if (!program) {
        throw ShaderError::invalid_state(fmt::format("null program added as '{}'", name));
    }

    {
        std::lock_guard lock(impl_->mutex);
        auto& entry = impl_->entries[name];
        entry.supplier = nullptr;
        impl_->retire(std::move(entry.program));
        entry.program = std::move(program);
        impl_->invalidate(entry);
    }
    PRISM_LOG_DEBUG(core::log_category::REGISTRY, "Added shader '{}'", name);
}

std::shared_ptr<ShaderProgram> ShaderRegistry::get(const std::string& name) {
    impl_->dispose_retired();

    for (;;) {
        std::shared_ptr<std::mutex> load_mutex;
        {
            std::lock_guard lock(impl_->mutex);
            auto it = impl_->entries.find(name);
            if (it == impl_->entries.end()) {
                throw ShaderError::unknown_shader(name);
            }
            if (it->second.program) {
                return it->second.program;
            }
            load_mutex = it->second.load_mutex;
        }

        std::lock_guard load_lock(*load_mutex);

        // Another caller may have finished while we waited
        Supplier supplier;
        uint64_t generation = 0;
        {
            std::lock_guard lock(impl_->mutex);
            auto it = impl_->entries.find(name);
            if (it == impl_->entries.end()) {
                throw ShaderError::unknown_shader(name);
            }
            if (it->second.program) {
                return it->second.program;
            }
            supplier = it->second.supplier;
            generation = it->second.generation;
        }

        PRISM_LOG_DEBUG(core::log_category::REGISTRY, "Materializing shader '{}'", name);
        std::shared_ptr<ShaderProgram> program = supplier();
        if (!program) {
            throw ShaderError::invalid_state(fmt::format("supplier for '{}' returned no program", name));
        }

        bool removed = false;
        {
            std::lock_guard lock(impl_->mutex);
            auto it = impl_->entries.find(name);
            if (it == impl_->entries.end()) {
                removed = true;
            } else if (it->second.generation == generation) {
                it->second.program = program;
                return program;
            }
        }

        // Removed, reloaded or re-registered while the supplier ran
        program->dispose();
        if (removed) {
            throw ShaderError::unknown_shader(name);
        }
        PRISM_LOG_DEBUG(core::log_category::REGISTRY, "Shader '{}' changed during load, retrying", name);
    }
}

std::shared_ptr<ShaderProgram> ShaderRegistry::try_get(const std::string& name) {
    try {
        return get(name);
    } catch (const ShaderError& e) {
        PRISM_LOG_WARN(core::log_category::REGISTRY, "Shader '{}' unavailable: {}", name, e.what());
    } catch (const std::exception& e) {
        PRISM_LOG_ERROR(core::log_category::REGISTRY, "Supplier for shader '{}' failed: {}", name, e.what());
    }
    return nullptr;
}

bool ShaderRegistry::has(const std::string& name) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->entries.count(name) > 0;
}

bool ShaderRegistry::is_realized(const std::string& name) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->entries.find(name);
    return it != impl_->entries.end() && it->second.program != nullptr;
}

bool ShaderRegistry::reload(const std::string& name) {
    std::vector<std::shared_ptr<ShaderProgram>> programs;
    bool found = false;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->take_retired(programs);
        auto it = impl_->entries.find(name);
        if (it != impl_->entries.end()) {
            found = true;
            if (it->second.program) {
                programs.push_back(std::move(it->second.program));
            }
            if (!it->second.supplier) {
                impl_->entries.erase(it);
            } else {
                impl_->invalidate(it->second);
            }
        }
    }

    dispose_all(programs);
    if (!found) {
        return false;
    }
    PRISM_LOG_INFO(core::log_category::REGISTRY, "Reloaded shader '{}'", name);
    return true;
}

size_t ShaderRegistry::reload_all() {
    std::vector<std::shared_ptr<ShaderProgram>> retired;
    std::vector<std::shared_ptr<ShaderProgram>> programs;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->take_retired(retired);
        for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
            if (it->second.program) {
                programs.push_back(std::move(it->second.program));
                it->second.program.reset();
            }
            if (!it->second.supplier) {
                it = impl_->entries.erase(it);
            } else {
                impl_->invalidate(it->second);
                ++it;
            }
        }
    }

    dispose_all(retired);
    size_t count = programs.size();
    dispose_all(programs);
    PRISM_LOG_INFO(core::log_category::REGISTRY, "Reloaded {} shader(s)", count);
    return count;
}

bool ShaderRegistry::remove(const std::string& name) {
    std::vector<std::shared_ptr<ShaderProgram>> programs;
    bool found = false;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->take_retired(programs);
        auto it = impl_->entries.find(name);
        if (it != impl_->entries.end()) {
            found = true;
            if (it->second.program) {
                programs.push_back(std::move(it->second.program));
            }
            impl_->entries.erase(it);
        }
    }

    dispose_all(programs);
    if (!found) {
        return false;
    }
    PRISM_LOG_DEBUG(core::log_category::REGISTRY, "Removed shader '{}'", name);
    return true;
}

void ShaderRegistry::dispose() {
    std::vector<std::shared_ptr<ShaderProgram>> retired;
    std::vector<std::shared_ptr<ShaderProgram>> programs;
    size_t registered = 0;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->take_retired(retired);
        registered = impl_->entries.size();
        for (auto& [name, entry] : impl_->entries) {
            if (entry.program) {
                programs.push_back(std::move(entry.program));
            }
        }
        impl_->entries.clear();
    }

    dispose_all(retired);
    if (registered == 0) {
        return;
    }
    size_t realized = programs.size();
    dispose_all(programs);
    PRISM_LOG_INFO(core::log_category::REGISTRY, "Disposed registry ({} registered, {} realized)", registered,
                   realized);
}

size_t ShaderRegistry::realized_count() const {
    std::lock_guard lock(impl_->mutex);
    return static_cast<size_t>(std::count_if(impl_->entries.begin(), impl_->entries.end(),
                                             [](const auto& item) { return item.second.program != nullptr; }));
}

size_t ShaderRegistry::registered_count() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->entries.size();
}

std::vector<std::string> ShaderRegistry::names() const {
    std::vector<std::string> result;
    {
        std::lock_guard lock(impl_->mutex);
        result.reserve(impl_->entries.size());
        for (const auto& [name, entry] : impl_->entries) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace prism::shader
