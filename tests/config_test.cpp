#include "planq/config/config.hpp"

#include "gtest/gtest.h"

#include <cstdlib>

using namespace planq;

namespace {

class ScopedEnv {
public:
  ScopedEnv(const char *key, const char *value) : key_(key) {
    ::setenv(key, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(key_); }

  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *key_;
};

} // namespace

TEST(ConfigTest, DatabaseDefaults) {
  DatabaseConfig db;
  EXPECT_EQ(db.host, "127.0.0.1");
  EXPECT_EQ(db.port, 3306);
  EXPECT_EQ(db.username, "planq");
  EXPECT_EQ(db.database, "planq");
}

TEST(ConfigTest, QueueDefaults) {
  QueueConfig q;
  EXPECT_TRUE(q.parallel);
  EXPECT_EQ(q.max_retries, 3);
  EXPECT_EQ(q.cancel_timeout, std::chrono::seconds(10));
  EXPECT_EQ(q.stale_threshold, std::chrono::hours(1));
  EXPECT_EQ(q.default_branches, (std::vector<std::string>{"main", "master"}));
}

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(*result, SystemConfig{});
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[database]
host = "db.internal"
port = 3307
database = "planq_test"

[queue]
parallel = false
max_retries = 5
cancel_timeout_sec = 3
stale_threshold_sec = 120
worktree_root = "/var/tmp/planq"
default_branches = ["trunk"]

[agent]
command = "/usr/local/bin/my-agent"
args = ["--json", "--quiet"]
timeout_sec = 600

[notify]
webhook_url = "http://hooks.local:9000/planq"
timeout_ms = 1500

[log]
level = "debug"
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->database.host, "db.internal");
  EXPECT_EQ(result->database.port, 3307);
  EXPECT_EQ(result->database.database, "planq_test");
  EXPECT_FALSE(result->queue.parallel);
  EXPECT_EQ(result->queue.max_retries, 5);
  EXPECT_EQ(result->queue.cancel_timeout, std::chrono::seconds(3));
  EXPECT_EQ(result->queue.stale_threshold, std::chrono::seconds(120));
  EXPECT_EQ(result->queue.worktree_root, "/var/tmp/planq");
  EXPECT_EQ(result->queue.default_branches,
            std::vector<std::string>{"trunk"});
  EXPECT_EQ(result->agent.command, "/usr/local/bin/my-agent");
  EXPECT_EQ(result->agent.args,
            (std::vector<std::string>{"--json", "--quiet"}));
  EXPECT_EQ(result->agent.timeout, std::chrono::seconds(600));
  EXPECT_EQ(result->notify.webhook_url, "http://hooks.local:9000/planq");
  EXPECT_EQ(result->notify.timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(result->log.level, "debug");
}

TEST(ConfigTest, RejectsNegativeRetryLimit) {
  auto result = ConfigLoader::load_from_string("[queue]\nmax_retries = -1\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsNonPositiveTimeouts) {
  auto result =
      ConfigLoader::load_from_string("[queue]\ncancel_timeout_sec = 0\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsEmptyAgentCommand) {
  auto result = ConfigLoader::load_from_string("[agent]\ncommand = \"\"\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsInvalidTrailerPattern) {
  auto result = ConfigLoader::load_from_string(
      "[policy]\nforbidden_trailer_pattern = \"([\"\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
  auto result = ConfigLoader::load_from_string("[log]\nlevel = \"loud\"\n");
  ASSERT_FALSE(result.has_value());
}

TEST(ConfigTest, MissingFileIsReported) {
  auto result = ConfigLoader::load_from_file("/nonexistent/planq.toml");
  ASSERT_FALSE(result.has_value());
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv parallel("PLANQ_QUEUE_PARALLEL", "0");
  ScopedEnv port("PLANQ_DB_PORT", "3310");
  ScopedEnv hook("PLANQ_WEBHOOK_URL", "http://127.0.0.1:1/hook");

  auto result = ConfigLoader::load_from_string(
      "[queue]\nparallel = true\n[database]\nport = 3306\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_FALSE(result->queue.parallel);
  EXPECT_EQ(result->database.port, 3310);
  EXPECT_EQ(result->notify.webhook_url, "http://127.0.0.1:1/hook");
}

TEST(ConfigTest, MalformedEnvironmentValueFailsToLoad) {
  ScopedEnv port("PLANQ_DB_PORT", "not-a-port");
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}
