// Prism Shader Tests
// uniform_cache_test.cpp - Uniform location memoization unit tests

#include <gtest/gtest.h>
#include <prism/shader/uniform_cache.hpp>

#include "../../support/counting_backend.hpp"

using namespace prism::shader;
using prism::graphics::INVALID_LOCATION;
using prism::test::CountingBackend;

class UniformCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_.uniforms["u_mvp"] = 0;
        backend_.uniforms["u_color"] = 3;
    }

    CountingBackend backend_;
    UniformCache cache_{backend_, 7};
};

TEST_F(UniformCacheTest, QueriesOncePerName) {
    EXPECT_EQ(cache_.location("u_color"), 3);
    EXPECT_EQ(cache_.location("u_color"), 3);
    EXPECT_EQ(cache_.location("u_mvp"), 0);
    EXPECT_EQ(cache_.location("u_mvp"), 0);

    EXPECT_EQ(backend_.queries_by_name["u_color"], 1);
    EXPECT_EQ(backend_.queries_by_name["u_mvp"], 1);
    EXPECT_EQ(backend_.uniform_location_queries, 2);
    EXPECT_EQ(cache_.size(), 2u);
}

TEST_F(UniformCacheTest, MissesAreCached) {
    EXPECT_EQ(cache_.location("u_optional"), INVALID_LOCATION);
    EXPECT_FALSE(cache_.exists("u_optional"));
    EXPECT_EQ(cache_.location("u_optional"), INVALID_LOCATION);

    EXPECT_EQ(backend_.queries_by_name["u_optional"], 1);
}

TEST_F(UniformCacheTest, Exists) {
    EXPECT_TRUE(cache_.exists("u_mvp"));
    EXPECT_FALSE(cache_.exists("u_missing"));
}

TEST_F(UniformCacheTest, InvalidateForcesRequery) {
    EXPECT_EQ(cache_.location("u_color"), 3);
    cache_.invalidate();
    EXPECT_EQ(cache_.size(), 0u);

    backend_.uniforms["u_color"] = 5;
    EXPECT_EQ(cache_.location("u_color"), 5);
    EXPECT_EQ(backend_.queries_by_name["u_color"], 2);
}

TEST_F(UniformCacheTest, ProgramHandle) {
    EXPECT_EQ(cache_.program(), 7u);
}
