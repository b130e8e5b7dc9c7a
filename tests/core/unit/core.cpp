#include <doctest/doctest.h>

#include <facemetrics/core/core.hpp>

#include <string_view>

TEST_SUITE("facemetrics::Core") {
  TEST_CASE("FACEMETRICS_STRINGIFY") {
    CHECK_EQ(std::string_view(FACEMETRICS_STRINGIFY(hello)), "hello");
    CHECK_EQ(std::string_view(FACEMETRICS_STRINGIFY(42)), "42");
  }

  TEST_CASE("FACEMETRICS_CONCAT") {
    constexpr int window5 = 5;
    CHECK_EQ(FACEMETRICS_CONCAT(window, 5), 5);
  }

  TEST_CASE("FACEMETRICS_ANONYMOUS_VAR: Distinct per line") {
    [[maybe_unused]] const int FACEMETRICS_ANONYMOUS_VAR(guard) = 1;
    [[maybe_unused]] const int FACEMETRICS_ANONYMOUS_VAR(guard) = 2;
    CHECK(true);
  }

  TEST_CASE("FACEMETRICS_EXPECT_TRUE: Preserves value") {
    CHECK(FACEMETRICS_EXPECT_TRUE(1 == 1));
    CHECK_FALSE(FACEMETRICS_EXPECT_FALSE(1 == 2));
  }
}  // TEST_SUITE
