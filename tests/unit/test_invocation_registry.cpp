#include <gtest/gtest.h>
#include "session/invocation_registry.hpp"

namespace {

using transpiler::core::errors::get_error;
using transpiler::core::errors::get_value;
using transpiler::core::errors::is_error;
using transpiler::session::InvocationRegistry;
using transpiler::session::InvocationState;

TEST(InvocationRegistryTest, BeginHandsOutUnsetToken) {
    InvocationRegistry registry;
    auto begun = registry.begin("1", "transpile_python");
    ASSERT_FALSE(is_error(begun));

    EXPECT_FALSE(get_value(begun)->load());
    EXPECT_EQ(registry.in_flight_count(), 1u);
    auto state = registry.get_state("1");
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), InvocationState::Running);
}

TEST(InvocationRegistryTest, RejectsDuplicateKeyWhileInFlight) {
    InvocationRegistry registry;
    ASSERT_FALSE(is_error(registry.begin("\"a\"", "transpile_python")));

    auto duplicate = registry.begin("\"a\"", "verify_python");
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_request_id");

    registry.finish("\"a\"");
    EXPECT_FALSE(is_error(registry.begin("\"a\"", "verify_python")));
}

TEST(InvocationRegistryTest, CancelFlipsTokenOnce) {
    InvocationRegistry registry;
    auto begun = registry.begin("7", "transpile_python");
    ASSERT_FALSE(is_error(begun));
    const auto token = get_value(begun);

    auto cancelled = registry.cancel("7");
    ASSERT_FALSE(is_error(cancelled));
    EXPECT_EQ(get_value(cancelled), InvocationState::Cancelled);
    EXPECT_TRUE(token->load());

    auto again = registry.cancel("7");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
}

TEST(InvocationRegistryTest, UnknownKeyIsNotFound) {
    InvocationRegistry registry;
    auto cancelled = registry.cancel("missing");
    ASSERT_TRUE(is_error(cancelled));
    EXPECT_EQ(get_error(cancelled).code, "invocation_not_found");

    auto state = registry.get_state("missing");
    ASSERT_TRUE(is_error(state));
    EXPECT_EQ(get_error(state).code, "invocation_not_found");
}

TEST(InvocationRegistryTest, FinishForgetsTheCall) {
    InvocationRegistry registry;
    ASSERT_FALSE(is_error(registry.begin("1", "transpile_python")));
    registry.finish("1");
    registry.finish("1");

    EXPECT_EQ(registry.in_flight_count(), 0u);
    EXPECT_TRUE(is_error(registry.get_state("1")));
}

TEST(InvocationRegistryTest, CancelAllCountsOnlyRunningCalls) {
    InvocationRegistry registry;
    auto first = registry.begin("1", "transpile_python");
    auto second = registry.begin("2", "verify_python");
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    ASSERT_FALSE(is_error(registry.cancel("1")));

    EXPECT_EQ(registry.cancel_all(), 1u);
    EXPECT_TRUE(get_value(first)->load());
    EXPECT_TRUE(get_value(second)->load());
    EXPECT_EQ(registry.cancel_all(), 0u);
    EXPECT_EQ(registry.in_flight_count(), 2u);
}

}  // namespace
