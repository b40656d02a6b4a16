// Prism Shader Tests
// shader_registry_test.cpp - Lazy shader registry unit tests

#include <gtest/gtest.h>
#include <prism/graphics/context.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/shader_program.hpp>
#include <prism/shader/shader_registry.hpp>

#include "../../support/counting_backend.hpp"
#include "../../support/shader_error_matchers.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace prism::shader;
using prism::graphics::GraphicsContext;
using prism::test::CountingBackend;

class ShaderRegistryTest : public ::testing::Test {
protected:
    // Supplier that counts its invocations
    ShaderRegistry::Supplier counting_supplier(std::atomic<int>& calls) {
        return [this, &calls]() {
            ++calls;
            return ShaderProgram::Builder(context_).vertex("void main() {}").fragment("void main() {}").build();
        };
    }

    CountingBackend backend_;
    GraphicsContext context_{backend_};
    ShaderRegistry registry_;
};

// ============================================================================
// Lookup
// ============================================================================

TEST_F(ShaderRegistryTest, UnknownNameIsCallerError) {
    try {
        (void)registry_.get("missing");
        FAIL() << "expected an unknown shader error";
    } catch (const ShaderError& e) {
        EXPECT_EQ(e.kind(), ShaderErrorKind::UnknownShaderName);
        EXPECT_EQ(e.subject(), "missing");
        EXPECT_FALSE(e.is_backend_error());
    }
    EXPECT_EQ(registry_.try_get("missing"), nullptr);
}

TEST_F(ShaderRegistryTest, RegisterIsLazy) {
    std::atomic<int> calls{0};
    registry_.register_shader("basic", counting_supplier(calls));

    EXPECT_EQ(calls.load(), 0);
    EXPECT_TRUE(registry_.has("basic"));
    EXPECT_FALSE(registry_.is_realized("basic"));
    EXPECT_EQ(registry_.registered_count(), 1u);
    EXPECT_EQ(registry_.realized_count(), 0u);
    EXPECT_EQ(backend_.create_program_calls, 0);
}

TEST_F(ShaderRegistryTest, GetMaterializesOnce) {
    std::atomic<int> calls{0};
    registry_.register_shader("basic", counting_supplier(calls));

    auto first = registry_.get("basic");
    auto second = registry_.get("basic");
    auto third = registry_.try_get("basic");

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, third);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(registry_.is_realized("basic"));
    EXPECT_EQ(registry_.realized_count(), 1u);
}

TEST_F(ShaderRegistryTest, ConcurrentFirstGetMaterializesOnce) {
    constexpr int THREAD_COUNT = 8;
    std::atomic<int> calls{0};
    registry_.register_shader("slow", [this, &calls]() {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return ShaderProgram::Builder(context_).vertex("v").fragment("f").build();
    });

    std::vector<std::shared_ptr<ShaderProgram>> results(THREAD_COUNT);
    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int i = 0; i < THREAD_COUNT; ++i) {
        threads.emplace_back([this, &results, i]() { results[i] = registry_.get("slow"); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(backend_.create_program_calls, 1);
    for (const auto& result : results) {
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result, results[0]);
    }
}

TEST_F(ShaderRegistryTest, SupplierFailureIsNotCached) {
    backend_.fail_link = true;
    std::atomic<int> calls{0};
    registry_.register_shader("broken", counting_supplier(calls));

    PRISM_EXPECT_SHADER_ERROR(LinkingFailed, (void)registry_.get("broken"));
    EXPECT_EQ(registry_.try_get("broken"), nullptr);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(registry_.realized_count(), 0u);
    EXPECT_TRUE(registry_.has("broken"));

    backend_.fail_link = false;
    EXPECT_NE(registry_.get("broken"), nullptr);
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(ShaderRegistryTest, SupplierReturningNothing) {
    registry_.register_shader("empty", []() { return std::unique_ptr<ShaderProgram>(); });
    PRISM_EXPECT_SHADER_ERROR(InvalidState, (void)registry_.get("empty"));
}

TEST_F(ShaderRegistryTest, EmptySupplierRejected) {
    PRISM_EXPECT_SHADER_ERROR(InvalidState, registry_.register_shader("none", ShaderRegistry::Supplier()));
    EXPECT_FALSE(registry_.has("none"));
}

// ============================================================================
// Reload
// ============================================================================

TEST_F(ShaderRegistryTest, ReloadRematerializes) {
    std::atomic<int> calls{0};
    registry_.register_shader("x", counting_supplier(calls));

    auto before = registry_.get("x");
    EXPECT_TRUE(registry_.reload("x"));
    EXPECT_TRUE(before->is_disposed());
    EXPECT_FALSE(registry_.is_realized("x"));
    EXPECT_TRUE(registry_.has("x"));

    auto after = registry_.get("x");
    EXPECT_NE(after, before);
    EXPECT_FALSE(after->is_disposed());
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(ShaderRegistryTest, ReloadUnrealizedKeepsSupplier) {
    std::atomic<int> calls{0};
    registry_.register_shader("x", counting_supplier(calls));

    EXPECT_TRUE(registry_.reload("x"));
    EXPECT_EQ(calls.load(), 0);
    EXPECT_NE(registry_.get("x"), nullptr);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(ShaderRegistryTest, ReloadUnknown) {
    EXPECT_FALSE(registry_.reload("missing"));
}

TEST_F(ShaderRegistryTest, ReloadAll) {
    std::atomic<int> calls{0};
    registry_.register_shader("a", counting_supplier(calls));
    registry_.register_shader("b", counting_supplier(calls));
    registry_.register_shader("c", counting_supplier(calls));
    auto a = registry_.get("a");
    auto b = registry_.get("b");

    EXPECT_EQ(registry_.reload_all(), 2u);
    EXPECT_TRUE(a->is_disposed());
    EXPECT_TRUE(b->is_disposed());
    EXPECT_EQ(registry_.realized_count(), 0u);
    EXPECT_EQ(registry_.registered_count(), 3u);
}

TEST_F(ShaderRegistryTest, ReloadDuringMaterializationDiscardsResult) {
    std::atomic<int> calls{0};
    registry_.register_shader("x", [this, &calls]() {
        if (++calls == 1) {
            registry_.reload("x");
        }
        return ShaderProgram::Builder(context_).vertex("v").fragment("f").build();
    });

    auto program = registry_.get("x");
    ASSERT_NE(program, nullptr);
    EXPECT_FALSE(program->is_disposed());
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(backend_.live_programs.size(), 1u);
}

// ============================================================================
// Add / Remove / Dispose
// ============================================================================

TEST_F(ShaderRegistryTest, AddRealizedProgram) {
    auto program = ShaderProgram::Builder(context_).vertex("v").fragment("f").build();
    auto* raw = program.get();
    registry_.add("ui", std::move(program));

    EXPECT_TRUE(registry_.is_realized("ui"));
    EXPECT_EQ(registry_.get("ui").get(), raw);

    // No supplier to rebuild from
    EXPECT_TRUE(registry_.reload("ui"));
    EXPECT_FALSE(registry_.has("ui"));
    EXPECT_TRUE(backend_.live_programs.empty());
}

TEST_F(ShaderRegistryTest, RemoveForgetsSupplier) {
    std::atomic<int> calls{0};
    registry_.register_shader("x", counting_supplier(calls));
    auto program = registry_.get("x");

    EXPECT_TRUE(registry_.remove("x"));
    EXPECT_TRUE(program->is_disposed());
    EXPECT_FALSE(registry_.has("x"));
    PRISM_EXPECT_SHADER_ERROR(UnknownShaderName, (void)registry_.get("x"));
    EXPECT_FALSE(registry_.remove("x"));
}

TEST_F(ShaderRegistryTest, RemoveDuringMaterialization) {
    registry_.register_shader("x", [this]() {
        registry_.remove("x");
        return ShaderProgram::Builder(context_).vertex("v").fragment("f").build();
    });

    PRISM_EXPECT_SHADER_ERROR(UnknownShaderName, (void)registry_.get("x"));
    EXPECT_TRUE(backend_.live_programs.empty());
    EXPECT_EQ(registry_.registered_count(), 0u);
}

TEST_F(ShaderRegistryTest, ReRegisterReplacesRealized) {
    std::atomic<int> first_calls{0};
    std::atomic<int> second_calls{0};
    registry_.register_shader("x", counting_supplier(first_calls));
    auto old_program = registry_.get("x");

    registry_.register_shader("x", counting_supplier(second_calls));
    EXPECT_FALSE(old_program->is_disposed());
    EXPECT_FALSE(registry_.is_realized("x"));
    EXPECT_EQ(registry_.registered_count(), 1u);

    auto new_program = registry_.get("x");
    EXPECT_TRUE(old_program->is_disposed());
    EXPECT_EQ(first_calls.load(), 1);
    EXPECT_EQ(second_calls.load(), 1);
    EXPECT_FALSE(new_program->is_disposed());
}

TEST_F(ShaderRegistryTest, ReRegisterFromAnotherThreadMakesNoBackendCalls) {
    std::atomic<int> calls{0};
    registry_.register_shader("x", counting_supplier(calls));
    auto old_program = registry_.get("x");
    int deletes_before = backend_.delete_program_calls;
    backend_.calling_threads.clear();

    std::thread producer([this, &calls]() { registry_.register_shader("x", counting_supplier(calls)); });
    producer.join();

    EXPECT_TRUE(backend_.calling_threads.empty());
    EXPECT_EQ(backend_.delete_program_calls, deletes_before);
    EXPECT_FALSE(old_program->is_disposed());

    // The replaced program goes away on the context thread
    auto new_program = registry_.get("x");
    EXPECT_TRUE(old_program->is_disposed());
    EXPECT_EQ(backend_.calling_threads, std::set<std::thread::id>{std::this_thread::get_id()});
    EXPECT_EQ(backend_.live_programs.size(), 1u);
}

TEST_F(ShaderRegistryTest, ReplacedProgramsDisposedByRegistryDispose) {
    registry_.add("ui", ShaderProgram::Builder(context_).vertex("v").fragment("f").build());
    auto first = registry_.get("ui");
    registry_.add("ui", ShaderProgram::Builder(context_).vertex("v").fragment("f").build());
    EXPECT_FALSE(first->is_disposed());

    registry_.dispose();
    EXPECT_TRUE(first->is_disposed());
    EXPECT_TRUE(backend_.live_programs.empty());
}

TEST_F(ShaderRegistryTest, DisposeClearsAndStaysUsable) {
    std::atomic<int> calls{0};
    registry_.register_shader("a", counting_supplier(calls));
    registry_.register_shader("b", counting_supplier(calls));
    auto a = registry_.get("a");

    registry_.dispose();
    EXPECT_TRUE(a->is_disposed());
    EXPECT_EQ(registry_.registered_count(), 0u);
    EXPECT_EQ(registry_.realized_count(), 0u);
    EXPECT_TRUE(backend_.live_programs.empty());

    registry_.register_shader("a", counting_supplier(calls));
    EXPECT_NE(registry_.get("a"), nullptr);
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(ShaderRegistryTest, NamesAreSorted) {
    std::atomic<int> calls{0};
    registry_.register_shader("water", counting_supplier(calls));
    registry_.register_shader("basic", counting_supplier(calls));
    registry_.register_shader("sky", counting_supplier(calls));

    EXPECT_EQ(registry_.names(), (std::vector<std::string>{"basic", "sky", "water"}));
}
