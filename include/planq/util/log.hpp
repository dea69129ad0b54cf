#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace planq::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Async logger: producers format on their own thread, a single writer
// thread drains the channel in batches.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 4096;
  static constexpr std::size_t BATCH_SIZE = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  [[nodiscard]] auto sink() const noexcept -> FILE * {
    auto *out = output_.load(std::memory_order_acquire);
    return out ? out : stdout;
  }

  auto write_batch(const std::vector<std::string> &batch) -> void {
    auto *out = sink();
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), out);
    }
    std::fflush(out);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(line));
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec) {
        break;
      }

      while (batch.size() < BATCH_SIZE &&
             queue->try_receive(
                 [&](const boost::system::error_code &ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
      write_batch(batch);
    }

    batch.clear();
    while (queue->try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            batch.push_back(std::move(line));
          }
        })) {
    }
    write_batch(batch);
  }

  template <typename... Args>
  [[nodiscard]] static auto format_line(Level level,
                                        std::format_string<Args...> fmt,
                                        Args &&...args) -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const bool color = ::isatty(::fileno(stderr)) != 0;
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] {}\n", now,
                       color ? level_color(level) : "", level_name(level),
                       color ? "\o{33}[0m" : "",
                       std::format(fmt, std::forward<Args>(args)...));
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    auto channel =
        std::make_shared<LogChannel>(queue_ctx_.get_executor(), QUEUE_CAPACITY);
    queue_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel = std::move(channel)] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
      queue->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  // Only honoured before start(); the writer thread owns the stream after.
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    if (path.empty()) {
      output_.store(stdout, std::memory_order_release);
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    output_.store(f, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line = format_line(level, fmt, std::forward<Args>(args)...);

    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, line)) {
      return;
    }
    if (queue) {
      // Channel full: never block a runtime thread on log I/O.
      return;
    }
    auto *out = sink();
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace planq::log
