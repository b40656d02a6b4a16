// Prism Shader Tests
// shader_loader_test.cpp - Source loading and supplier unit tests

#include <gtest/gtest.h>
#include <prism/core/config.hpp>
#include <prism/graphics/context.hpp>
#include <prism/shader/shader_loader.hpp>
#include <prism/shader/shader_program.hpp>
#include <prism/shader/source_reader.hpp>

#include "../../support/counting_backend.hpp"
#include "../../support/shader_error_matchers.hpp"

using namespace prism::shader;
using prism::graphics::GraphicsContext;
using prism::graphics::StageKind;
using prism::test::CountingBackend;

class ShaderLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        reader_.add("common/defs.glsl", "#define PI 3.14159");
        reader_.add("basic.vert", "#include \"common/defs.glsl\"\nvoid main() {}");
        reader_.add("basic.frag", "out vec4 color;\nvoid main() {}");
        reader_.add("grass.geom", "layout(points) in;");
    }

    CountingBackend backend_;
    GraphicsContext context_{backend_};
    MemorySourceReader reader_;
    ShaderLoader loader_{context_, reader_};
};

TEST_F(ShaderLoaderTest, ReadInfersStageAndExpands) {
    auto source = loader_.read("basic.vert");
    EXPECT_EQ(source.stage(), StageKind::Vertex);
    EXPECT_EQ(source.path(), "basic.vert");
    EXPECT_EQ(source.text(), "#define PI 3.14159\nvoid main() {}");
    EXPECT_EQ(source.display_name(), "basic.vert");
}

TEST_F(ShaderLoaderTest, ReadWithExplicitStage) {
    auto source = loader_.read("common/defs.glsl", StageKind::Compute);
    EXPECT_EQ(source.stage(), StageKind::Compute);
}

TEST_F(ShaderLoaderTest, ReadUnknownExtension) {
    PRISM_EXPECT_SHADER_ERROR(InvalidState, (void)loader_.read("common/defs.glsl"));
}

TEST_F(ShaderLoaderTest, IncludeProcessingCanBeDisabled) {
    LoaderOptions options;
    options.process_includes = false;
    ShaderLoader raw_loader(context_, reader_, options);

    EXPECT_EQ(raw_loader.read("basic.vert").text(), "#include \"common/defs.glsl\"\nvoid main() {}");
}

TEST_F(ShaderLoaderTest, LoadBasePath) {
    auto program = loader_.load("basic");

    ASSERT_NE(program, nullptr);
    EXPECT_EQ(program->label(), "basic");
    EXPECT_TRUE(program->has_stage(StageKind::Vertex));
    EXPECT_TRUE(program->has_stage(StageKind::Fragment));
    ASSERT_EQ(backend_.compiled_sources.size(), 2u);
    EXPECT_EQ(backend_.compiled_sources[0], "#define PI 3.14159\nvoid main() {}");
}

TEST_F(ShaderLoaderTest, LoadExplicitPair) {
    reader_.add("alt/screen.vs", "void main() {}");
    auto program = loader_.load("alt/screen.vs", "basic.frag");
    EXPECT_EQ(program->stage_count(), 2u);
}

TEST_F(ShaderLoaderTest, MissingSourceFailsBeforeCompiling) {
    PRISM_EXPECT_SHADER_ERROR(ResourceNotFound, (void)loader_.load("missing"));
    EXPECT_EQ(backend_.create_shader_calls, 0);
    EXPECT_EQ(backend_.create_program_calls, 0);
}

TEST_F(ShaderLoaderTest, LoadStages) {
    auto program = loader_.load_stages({"basic.vert", "grass.geom", "basic.frag"});
    EXPECT_EQ(program->stage_count(), 3u);
    EXPECT_TRUE(program->has_stage(StageKind::Geometry));
    EXPECT_EQ(program->label(), "basic.vert, grass.geom, basic.frag");
}

TEST_F(ShaderLoaderTest, FromSourceSkipsPreprocessing) {
    auto program = loader_.from_source("#include \"common/defs.glsl\"\nvoid main() {}", "void main() {}");
    ASSERT_EQ(backend_.compiled_sources.size(), 2u);
    EXPECT_EQ(backend_.compiled_sources[0], "#include \"common/defs.glsl\"\nvoid main() {}");
}

TEST_F(ShaderLoaderTest, ValidationFollowsOptions) {
    LoaderOptions options;
    options.validate_programs = false;
    ShaderLoader quiet_loader(context_, reader_, options);

    auto program = quiet_loader.load("basic");
    EXPECT_EQ(backend_.validate_calls, 0);
}

TEST_F(ShaderLoaderTest, SuppliersDeferLoading) {
    ShaderRegistry registry;
    registry.register_shader("basic", loader_.supplier("basic"));
    registry.register_shader("grass", loader_.supplier(std::vector<std::string>{"basic.vert", "grass.geom"}));
    EXPECT_EQ(backend_.create_shader_calls, 0);

    auto basic = registry.get("basic");
    auto grass = registry.get("grass");
    EXPECT_EQ(basic->label(), "basic");
    EXPECT_TRUE(grass->has_stage(StageKind::Geometry));
    EXPECT_EQ(backend_.create_program_calls, 2);

    // Reload reads the sources again
    reader_.add("basic.frag", "out vec4 color;\nvoid main() { color = vec4(1.0); }");
    registry.reload("basic");
    (void)registry.get("basic");
    EXPECT_EQ(backend_.compiled_sources.back(), "out vec4 color;\nvoid main() { color = vec4(1.0); }");
}

// ============================================================================
// Options
// ============================================================================

TEST(LoaderOptionsTest, Defaults) {
    prism::core::Config config;
    auto options = LoaderOptions::from_config(config);
    EXPECT_EQ(options.root_directory, "shaders");
    EXPECT_TRUE(options.process_includes);
    EXPECT_TRUE(options.validate_programs);
}

TEST(LoaderOptionsTest, FromConfig) {
    prism::core::Config config;
    ASSERT_TRUE(config.load_from_string(R"({
        "shaders": {
            "root_directory": "assets/glsl",
            "process_includes": false,
            "validate_programs": false
        }
    })"));

    auto options = LoaderOptions::from_config(config);
    EXPECT_EQ(options.root_directory, "assets/glsl");
    EXPECT_FALSE(options.process_includes);
    EXPECT_FALSE(options.validate_programs);
}
