#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace planq {

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"planq"};
  std::string password{"planq"};
  std::string database{"planq"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

namespace queue_defaults {
inline constexpr int kMaxRetries = 3;
inline constexpr std::chrono::seconds kCancelTimeout{10};
inline constexpr std::chrono::seconds kStaleThreshold{3600};
} // namespace queue_defaults

struct QueueConfig {
  bool parallel{true};
  int max_retries{queue_defaults::kMaxRetries};
  std::chrono::milliseconds cancel_timeout{queue_defaults::kCancelTimeout};
  std::chrono::seconds stale_threshold{queue_defaults::kStaleThreshold};
  std::string worktree_root; // empty = system temp directory
  std::vector<std::string> default_branches{"main", "master"};

  auto operator==(const QueueConfig &) const -> bool = default;
};

struct AgentConfig {
  std::string command{"planq-agent"};
  std::vector<std::string> args;
  std::chrono::seconds timeout{std::chrono::seconds(3600)};

  auto operator==(const AgentConfig &) const -> bool = default;
};

struct PolicyConfig {
  std::string forbidden_trailer_pattern{R"(co-authored-by:\s*.*claude)"};

  auto operator==(const PolicyConfig &) const -> bool = default;
};

struct NotifyConfig {
  std::string webhook_url;
  std::chrono::milliseconds timeout{5000};

  auto operator==(const NotifyConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct SystemConfig {
  DatabaseConfig database;
  QueueConfig queue;
  AgentConfig agent;
  PolicyConfig policy;
  NotifyConfig notify;
  LogConfig log;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace planq
