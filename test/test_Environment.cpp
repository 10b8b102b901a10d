#include "duct/Environment.hpp"

#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

using namespace duct;

TEST(Environment, SnapshotSeesProcessEnvironment) {
  ASSERT_TRUE(core::set_variable("DUCT_ENV_TEST", "first").has_value());
  auto snapshot = core::environment_snapshot();
  ASSERT_TRUE(snapshot.contains("DUCT_ENV_TEST"));
  EXPECT_EQ(snapshot.at("DUCT_ENV_TEST"), "first");
  ASSERT_TRUE(core::unset_variable("DUCT_ENV_TEST").has_value());
}

TEST(Environment, SnapshotIsACopy) {
  ASSERT_TRUE(core::set_variable("DUCT_ENV_TEST", "before").has_value());
  auto snapshot = core::environment_snapshot();
  ASSERT_TRUE(core::set_variable("DUCT_ENV_TEST", "after").has_value());

  EXPECT_EQ(snapshot.at("DUCT_ENV_TEST"), "before");
  EXPECT_EQ(core::environment_snapshot().at("DUCT_ENV_TEST"), "after");

  ASSERT_TRUE(core::unset_variable("DUCT_ENV_TEST").has_value());
  EXPECT_FALSE(core::environment_snapshot().contains("DUCT_ENV_TEST"));
}

TEST(Environment, InvalidNameFails) {
  auto result = core::set_variable("BAD=NAME", "x");
  EXPECT_FALSE(result.has_value());
}

TEST(Environment, EnvBlockFormat) {
  EnvMap         env{{"A", "1"}, {"B", ""}, {"C", "x=y"}};
  core::EnvBlock block{env};

  ASSERT_EQ(block.entries().size(), 3u);
  EXPECT_EQ(block.entries()[0], "A=1");
  EXPECT_EQ(block.entries()[1], "B=");
  EXPECT_EQ(block.entries()[2], "C=x=y");

  char* const* data = block.data();
  EXPECT_STREQ(data[0], "A=1");
  EXPECT_STREQ(data[2], "C=x=y");
  EXPECT_EQ(data[3], nullptr);
}

TEST(Environment, EmptyEnvBlock) {
  core::EnvBlock block{EnvMap{}};
  EXPECT_TRUE(block.entries().empty());
  EXPECT_EQ(block.data()[0], nullptr);
}
