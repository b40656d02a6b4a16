// Prism Graphics Tests
// context_test.cpp - Execution context unit tests

#include <gtest/gtest.h>
#include <prism/graphics/context.hpp>

#include "../../support/counting_backend.hpp"

using namespace prism::graphics;
using prism::test::CountingBackend;

class GraphicsContextTest : public ::testing::Test {
protected:
    CountingBackend backend_;
    GraphicsContext context_{backend_};
};

TEST_F(GraphicsContextTest, StartsUnbound) {
    EXPECT_EQ(context_.bound_program(), NULL_HANDLE);
    EXPECT_FALSE(context_.is_bound(NULL_HANDLE));
    EXPECT_EQ(&context_.backend(), &backend_);
}

TEST_F(GraphicsContextTest, UseSkipsRedundantActivation) {
    EXPECT_TRUE(context_.use_program(4));
    EXPECT_FALSE(context_.use_program(4));
    EXPECT_TRUE(context_.is_bound(4));
    EXPECT_EQ(backend_.use_program_calls, 1);

    EXPECT_TRUE(context_.use_program(9));
    EXPECT_FALSE(context_.is_bound(4));
    EXPECT_EQ(backend_.use_history, (std::vector<ProgramHandle>{4, 9}));
}

TEST_F(GraphicsContextTest, ReleaseOnlyActiveProgram) {
    context_.use_program(4);

    EXPECT_FALSE(context_.release_program(9));
    EXPECT_FALSE(context_.release_program(NULL_HANDLE));
    EXPECT_TRUE(context_.is_bound(4));

    EXPECT_TRUE(context_.release_program(4));
    EXPECT_EQ(context_.bound_program(), NULL_HANDLE);
    EXPECT_EQ(backend_.use_history.back(), NULL_HANDLE);
}

TEST_F(GraphicsContextTest, ClearAlwaysIssuesCall) {
    context_.clear_program();
    EXPECT_EQ(backend_.use_program_calls, 1);
    EXPECT_EQ(context_.bound_program(), NULL_HANDLE);
}
