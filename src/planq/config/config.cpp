#include "planq/config/config.hpp"
#include "planq/config/toml_util.hpp"

#include "planq/core/error.hpp"
#include "planq/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace planq {
namespace detail {

struct DatabaseToml {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"planq"};
  std::string password{"planq"};
  std::string database{"planq"};
  uint16_t pool_size{4};
  uint16_t connect_timeout{5};
};

struct QueueToml {
  bool parallel{true};
  int max_retries{queue_defaults::kMaxRetries};
  int cancel_timeout_sec{
      static_cast<int>(queue_defaults::kCancelTimeout.count())};
  int stale_threshold_sec{
      static_cast<int>(queue_defaults::kStaleThreshold.count())};
  std::string worktree_root;
  std::vector<std::string> default_branches{"main", "master"};
};

struct AgentToml {
  std::string command{"planq-agent"};
  std::vector<std::string> args;
  int timeout_sec{3600};
};

struct PolicyToml {
  std::string forbidden_trailer_pattern{R"(co-authored-by:\s*.*claude)"};
};

struct NotifyToml {
  std::string webhook_url;
  int timeout_ms{5000};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct SystemToml {
  DatabaseToml database{};
  QueueToml queue{};
  AgentToml agent{};
  PolicyToml policy{};
  NotifyToml notify{};
  LogToml log{};
};

} // namespace detail
} // namespace planq

namespace glz {
template <> struct meta<planq::detail::DatabaseToml> {
  using T = planq::detail::DatabaseToml;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<planq::detail::QueueToml> {
  using T = planq::detail::QueueToml;
  static constexpr auto value =
      object("parallel", &T::parallel, "max_retries", &T::max_retries,
             "cancel_timeout_sec", &T::cancel_timeout_sec,
             "stale_threshold_sec", &T::stale_threshold_sec, "worktree_root",
             &T::worktree_root, "default_branches", &T::default_branches);
};

template <> struct meta<planq::detail::AgentToml> {
  using T = planq::detail::AgentToml;
  static constexpr auto value = object("command", &T::command, "args",
                                       &T::args, "timeout_sec", &T::timeout_sec);
};

template <> struct meta<planq::detail::PolicyToml> {
  using T = planq::detail::PolicyToml;
  static constexpr auto value =
      object("forbidden_trailer_pattern", &T::forbidden_trailer_pattern);
};

template <> struct meta<planq::detail::NotifyToml> {
  using T = planq::detail::NotifyToml;
  static constexpr auto value =
      object("webhook_url", &T::webhook_url, "timeout_ms", &T::timeout_ms);
};

template <> struct meta<planq::detail::LogToml> {
  using T = planq::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<planq::detail::SystemToml> {
  using T = planq::detail::SystemToml;
  static constexpr auto value =
      object("database", &T::database, "queue", &T::queue, "agent", &T::agent,
             "policy", &T::policy, "notify", &T::notify, "log", &T::log);
};
} // namespace glz

namespace planq {
namespace {

[[nodiscard]] auto env_flag(std::string_view v) -> bool {
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("PLANQ_DB_HOST"); v != nullptr) {
    cfg.database.host = v;
  }
  if (const char *v = std::getenv("PLANQ_DB_PORT"); v != nullptr) {
    cfg.database.port = boost::lexical_cast<uint16_t>(v);
  }
  if (const char *v = std::getenv("PLANQ_DB_USERNAME"); v != nullptr) {
    cfg.database.username = v;
  }
  if (const char *v = std::getenv("PLANQ_DB_PASSWORD"); v != nullptr) {
    cfg.database.password = v;
  }
  if (const char *v = std::getenv("PLANQ_DB_DATABASE"); v != nullptr) {
    cfg.database.database = v;
  }
  if (const char *v = std::getenv("PLANQ_QUEUE_PARALLEL"); v != nullptr) {
    cfg.queue.parallel = env_flag(v);
  }
  if (const char *v = std::getenv("PLANQ_AGENT_COMMAND"); v != nullptr) {
    cfg.agent.command = v;
  }
  if (const char *v = std::getenv("PLANQ_WEBHOOK_URL"); v != nullptr) {
    cfg.notify.webhook_url = v;
  }
  if (const char *v = std::getenv("PLANQ_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
}

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  if (cfg.queue.max_retries < 0 || cfg.queue.cancel_timeout.count() <= 0 ||
      cfg.queue.stale_threshold.count() <= 0 ||
      cfg.agent.timeout.count() <= 0 || cfg.notify.timeout.count() <= 0) {
    log::error("Invalid configuration: timeouts must be positive and "
               "max_retries non-negative");
    return fail(Error::ParseError);
  }
  if (cfg.agent.command.empty()) {
    log::error("Invalid configuration: agent.command is empty");
    return fail(Error::ParseError);
  }
  if (cfg.queue.default_branches.empty()) {
    log::error("Invalid configuration: queue.default_branches is empty");
    return fail(Error::ParseError);
  }
  if (!log::parse_level(cfg.log.level)) {
    log::error("Invalid configuration: unknown log level '{}'", cfg.log.level);
    return fail(Error::ParseError);
  }
  try {
    std::regex compiled(cfg.policy.forbidden_trailer_pattern,
                        std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error &e) {
    log::error("Invalid configuration: policy.forbidden_trailer_pattern: {}",
               e.what());
    return fail(Error::ParseError);
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.database.host = std::move(raw.database.host);
  cfg.database.port = raw.database.port;
  cfg.database.username = std::move(raw.database.username);
  cfg.database.password = std::move(raw.database.password);
  cfg.database.database = std::move(raw.database.database);
  cfg.database.pool_size = raw.database.pool_size;
  cfg.database.connect_timeout = raw.database.connect_timeout;

  cfg.queue.parallel = raw.queue.parallel;
  cfg.queue.max_retries = raw.queue.max_retries;
  cfg.queue.cancel_timeout = std::chrono::seconds(raw.queue.cancel_timeout_sec);
  cfg.queue.stale_threshold =
      std::chrono::seconds(raw.queue.stale_threshold_sec);
  cfg.queue.worktree_root = std::move(raw.queue.worktree_root);
  cfg.queue.default_branches = std::move(raw.queue.default_branches);

  cfg.agent.command = std::move(raw.agent.command);
  cfg.agent.args = std::move(raw.agent.args);
  cfg.agent.timeout = std::chrono::seconds(raw.agent.timeout_sec);

  cfg.policy.forbidden_trailer_pattern =
      std::move(raw.policy.forbidden_trailer_pattern);

  cfg.notify.webhook_url = std::move(raw.notify.webhook_url);
  cfg.notify.timeout = std::chrono::milliseconds(raw.notify.timeout_ms);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  apply_env_overrides(cfg);

  if (auto valid = validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace planq
