#include "planq/cli/runtime.hpp"

#include "planq/cli/formatting.hpp"
#include "planq/core/asio_awaitable.hpp"
#include "planq/store/memory_store.hpp"
#include "planq/store/mysql_store.hpp"
#include "planq/util/log.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <print>
#include <variant>

namespace planq::cli {

namespace {

[[nodiscard]] auto payload_text(const JsonValue &payload, std::string_view key)
    -> std::string {
  if (!payload.is_object()) {
    return {};
  }
  const auto &obj = payload.get_object();
  auto it = obj.find(std::string(key));
  if (it == obj.end() || !it->second.is_string()) {
    return {};
  }
  return it->second.get_string();
}

auto print_event(const RunEvent &event) -> void {
  const auto task = event.task_id.empty() ? std::string{"-"}
                                          : event.task_id.str();
  switch (event.type) {
  case EventType::Log:
  case EventType::TodoUpdate:
    return;
  case EventType::Started:
    std::println("{} {} {}", fmt::ansi::blue("▶"), fmt::ansi::bold(task),
                 payload_text(event.payload, "message"));
    return;
  case EventType::Completed:
    std::println("{} {} completed", fmt::ansi::green("✓"),
                 fmt::ansi::bold(task));
    return;
  case EventType::Failed:
    std::println("{} {} failed: {}", fmt::ansi::red("✗"),
                 fmt::ansi::bold(task), payload_text(event.payload, "error"));
    return;
  case EventType::Cancelled:
    std::println("{} {} {}", fmt::ansi::yellow("■"), fmt::ansi::bold(task),
                 payload_text(event.payload, "message"));
    return;
  case EventType::TaskStatus:
    if (auto msg = payload_text(event.payload, "message"); !msg.empty()) {
      std::println("  {}", msg);
    }
    return;
  case EventType::Info:
    if (auto msg = payload_text(event.payload, "message"); !msg.empty()) {
      std::println("  {}", event.level == EventLevel::Error
                               ? fmt::ansi::red(msg)
                               : fmt::ansi::dim(msg));
    }
    return;
  }
}

} // namespace

auto report_failure(const Failure &failure) -> int {
  std::println(stderr, "Error: {}", failure.message());
  return 1;
}

auto report_error(std::error_code ec) -> int {
  std::println(stderr, "Error: {}", ec.message());
  return 1;
}

auto Runtime::create(const CommonOptions &common, StoreKind kind)
    -> std::unique_ptr<Runtime> {
  log::set_output_stderr();
  auto config = common.config_file.empty()
                    ? ConfigLoader::load_from_string("")
                    : ConfigLoader::load_from_file(common.config_file);
  if (!config) {
    report_error(config.error());
    return nullptr;
  }

  const auto level = common.log_level.value_or(config->log.level);
  if (!log::parse_level(level)) {
    std::println(stderr, "Error: unknown log level '{}'", level);
    return nullptr;
  }
  log::set_level(level);

  const auto log_file = common.log_file.value_or(config->log.file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: cannot open log file '{}'", log_file);
    return nullptr;
  }

  return std::make_unique<Runtime>(Key{}, std::move(*config), kind);
}

Runtime::Runtime(Key /*key*/, Config config, StoreKind kind)
    : config_(std::move(config)), agent_(config_.agent) {
  if (kind == StoreKind::InMemory) {
    store_ = std::make_unique<InMemoryStore>();
  } else {
    store_ = std::make_unique<MySqlStore>(io_.get_executor(), config_.database);
  }
  orchestrator_ = std::make_unique<Orchestrator>(
      io_.get_executor(), *store_, agent_, config_.queue, config_.policy);
}

Runtime::~Runtime() { shutdown(); }

auto Runtime::open(bool recover) -> Result<void> {
  if (auto r = block_on(store_->open()); !r) {
    return fail(r.error());
  }
  if (!recover) {
    return ok();
  }
  if (auto cleaned = block_on(orchestrator_->cleanup_stale_runs()); !cleaned) {
    log::warn("stale run cleanup failed: {}", cleaned.error().message());
  }
  block_on(configure_notifications());
  return ok();
}

auto Runtime::configure_notifications() -> task<void> {
  auto url = config_.notify.webhook_url;
  auto setting = co_await store_->get_setting(settings::kWebhookUrl);
  if (!setting) {
    log::warn("reading setting {} failed: {}", settings::kWebhookUrl,
              setting.error().message());
  } else if (*setting && !(*setting)->empty()) {
    url = **setting;
  }
  if (url.empty()) {
    co_return;
  }

  notifier_.emplace(io_.get_executor(), std::move(url),
                    config_.notify.timeout);
  orchestrator_->set_milestone_sink(
      [this](const Milestone &m) { notifier_->notify(m); });
  log::debug("milestone webhook: {}", notifier_->url());
}

auto Runtime::follow_events() -> void {
  orchestrator_->set_event_sink(
      [](const RunEvent &event) { print_event(event); });
}

auto Runtime::wait_interruptible(task<void> wait, InterruptHandler on_interrupt)
    -> void {
  block_on([](task<void> wait, InterruptHandler on_interrupt) -> task<void> {
    using namespace awaitable_ops;
    boost::asio::signal_set signals(co_await boost::asio::this_coro::executor,
                                    SIGINT, SIGTERM);
    auto first = co_await (std::move(wait) || signals.async_wait(use_nothrow));
    if (first.index() == 0) {
      co_return;
    }
    auto [ec, signo] = std::get<1>(first);
    if (ec) {
      co_return;
    }
    std::println(stderr, "Received signal {}, stopping...", signo);
    co_await on_interrupt();
  }(std::move(wait), std::move(on_interrupt)));
}

auto Runtime::shutdown() -> void {
  if (closed_) {
    return;
  }
  closed_ = true;

  const auto deadline =
      std::chrono::steady_clock::now() + config_.notify.timeout * 2;
  while (notifier_ && notifier_->pending() > 0 &&
         std::chrono::steady_clock::now() < deadline) {
    if (io_.run_one_for(std::chrono::milliseconds(50)) == 0 && io_.stopped()) {
      io_.restart();
    }
  }
  if (store_->is_open()) {
    block_on(store_->close());
  }
}

} // namespace planq::cli
