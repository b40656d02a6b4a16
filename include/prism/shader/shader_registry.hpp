// Prism Shader Core
// shader_registry.hpp - Named, lazily materialized shader programs

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace prism::shader {

class ShaderProgram;

// Named collection of programs, each produced on first use by a registered
// supplier and cached until reloaded, removed or disposed.
//
// The maps are safe to use from any thread. register_shader(), add() and the
// queries make no backend calls and may run anywhere. get(), try_get(),
// reload(), reload_all(), remove(), dispose() and the destructor build or
// dispose programs, so they belong on the thread owning the graphics context.
// Concurrent first get() calls for the same name run the supplier once and
// all receive the same instance.
class ShaderRegistry {
public:
    using Supplier = std::function<std::unique_ptr<ShaderProgram>()>;

    ShaderRegistry();
    ~ShaderRegistry();

    // Non-copyable
    ShaderRegistry(const ShaderRegistry&) = delete;
    ShaderRegistry& operator=(const ShaderRegistry&) = delete;

    // Store a lazy supplier; nothing is built until get(). Registering an
    // existing name replaces its supplier; a realized program is retired and
    // disposed by the next context-thread call.
    void register_shader(const std::string& name, Supplier supplier);

    // Store an already built program. It has no supplier, so reload() drops it.
    // A program it replaces is retired like in register_shader().
    void add(const std::string& name, std::unique_ptr<ShaderProgram> program);

    // Cached program, materializing it on first access.
    // Throws ShaderError::UnknownShaderName for names never registered (or
    // removed while loading), and whatever the supplier throws.
    [[nodiscard]] std::shared_ptr<ShaderProgram> get(const std::string& name);

    // Like get(), but any failure yields nullptr (logged)
    [[nodiscard]] std::shared_ptr<ShaderProgram> try_get(const std::string& name);

    // Registered, realized or not
    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] bool is_realized(const std::string& name) const;

    // Dispose the realized program, keeping the supplier for the next get().
    // An entry without a supplier is disposed and forgotten. Returns false
    // for unknown names.
    bool reload(const std::string& name);

    // reload() every entry; returns the number of programs disposed
    size_t reload_all();

    // Dispose and forget both program and supplier
    bool remove(const std::string& name);

    // Dispose every realized program and forget all entries. The registry
    // stays usable.
    void dispose();

    [[nodiscard]] size_t realized_count() const;
    [[nodiscard]] size_t registered_count() const;

    // Sorted registered names
    [[nodiscard]] std::vector<std::string> names() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace prism::shader
