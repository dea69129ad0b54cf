#pragma once

#include "planq/agent/command_agent.hpp"
#include "planq/cli/commands.hpp"
#include "planq/config/config.hpp"
#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"
#include "planq/notify/webhook_notifier.hpp"
#include "planq/orchestrator/orchestrator.hpp"
#include "planq/store/store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>

namespace planq::cli {

enum class StoreKind : std::uint8_t { MySql, InMemory };

/// Everything one CLI command needs: config, logging, a store, and the
/// orchestrator, all driven by a single io_context owned here.
class Runtime {
  // Restricts construction to create().
  struct Key {
    explicit Key() = default;
  };

public:
  using InterruptHandler = std::move_only_function<task<void>()>;

  /// Loads config (defaults when `config_file` is empty) and applies the
  /// logging flags. Reports errors on stderr.
  [[nodiscard]] static auto create(const CommonOptions &common,
                                   StoreKind kind = StoreKind::MySql)
      -> std::unique_ptr<Runtime>;

  Runtime(Key key, Config config, StoreKind kind);
  ~Runtime();

  Runtime(const Runtime &) = delete;
  auto operator=(const Runtime &) -> Runtime & = delete;

  /// Opens the store. With `recover`, stale runs left by a crashed process
  /// are cleaned up and the orchestrator is wired for notifications.
  [[nodiscard]] auto open(bool recover = true) -> Result<void>;

  /// Drives the io_context until `op` completes.
  template <typename T> auto block_on(task<T> op) -> T {
    auto fut = co_spawn(io_, std::move(op), boost::asio::use_future);
    while (fut.wait_for(std::chrono::seconds(0)) !=
           std::future_status::ready) {
      if (io_.run_one() == 0) {
        io_.restart();
      }
    }
    return fut.get();
  }

  /// Waits for `wait`; on SIGINT/SIGTERM runs `on_interrupt` instead, which
  /// is expected to stop the work and wait for it.
  auto wait_interruptible(task<void> wait, InterruptHandler on_interrupt)
      -> void;

  /// Prints run progress events on stdout as they happen.
  auto follow_events() -> void;

  /// Lets background deliveries (webhooks) finish, then closes the store.
  auto shutdown() -> void;

  [[nodiscard]] auto config() const noexcept -> const Config & {
    return config_;
  }
  [[nodiscard]] auto store() noexcept -> Store & { return *store_; }
  [[nodiscard]] auto orchestrator() noexcept -> Orchestrator & {
    return *orchestrator_;
  }
  [[nodiscard]] auto io() noexcept -> boost::asio::io_context & { return io_; }

private:
  auto configure_notifications() -> task<void>;

  Config config_;
  boost::asio::io_context io_;
  std::unique_ptr<Store> store_;
  CommandAgent agent_;
  std::unique_ptr<Orchestrator> orchestrator_;
  std::optional<WebhookNotifier> notifier_;
  bool closed_{false};
};

/// Prints `Error: <reason>` on stderr and returns the exit code.
auto report_failure(const Failure &failure) -> int;
auto report_error(std::error_code ec) -> int;

} // namespace planq::cli
