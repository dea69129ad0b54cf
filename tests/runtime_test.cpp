#include "planq/cli/runtime.hpp"

#include <gtest/gtest.h>

using namespace planq;
using namespace planq::cli;

TEST(RuntimeTest, CreatesInMemoryRuntimeFromDefaults) {
  auto rt = Runtime::create(CommonOptions{.log_level = "warn"},
                            StoreKind::InMemory);
  ASSERT_NE(rt, nullptr);
  EXPECT_FALSE(rt->store().is_open());
  ASSERT_TRUE(rt->open(false).has_value());
  EXPECT_TRUE(rt->store().is_open());
  EXPECT_EQ(rt->config().queue.max_retries, 3);
  rt->shutdown();
  EXPECT_FALSE(rt->store().is_open());
}

TEST(RuntimeTest, UnknownLogLevelIsRejected) {
  EXPECT_EQ(Runtime::create(CommonOptions{.log_level = "chatty"},
                            StoreKind::InMemory),
            nullptr);
}

TEST(RuntimeTest, MissingConfigFileIsRejected) {
  EXPECT_EQ(Runtime::create(
                CommonOptions{.config_file = "/nonexistent/planq.toml"},
                StoreKind::InMemory),
            nullptr);
}
