#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace planq {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  CycleDetected,
  InvalidState,
  InvalidUrl,
  ProcessSpawnFailed,
  ProtocolError,
  PolicyViolation,
  MaxRetriesExceeded,
  GitCommandFailed,
  MergeConflict,
  AgentFailed,
  SystemNotRunning,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 24> messages = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "cycle detected in plan",
      "invalid state transition",
      "invalid URL",
      "failed to spawn process",
      "protocol error",
      "policy violation",
      "maximum retry limit reached",
      "git command failed",
      "merge conflict",
      "agent execution failed",
      "system not running",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "planq";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      std::unreachable();
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Concept for types that can be used with Result<T>
template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

/// Error code plus a reason string meant for direct display.
struct Failure {
  std::error_code code;
  std::string reason;

  [[nodiscard]] auto message() const -> std::string {
    return reason.empty() ? code.message() : reason;
  }
};

template <typename T> using Outcome = std::expected<T, Failure>;

[[nodiscard]] inline auto fail_with(Error e, std::string reason)
    -> std::unexpected<Failure> {
  return std::unexpected{
      Failure{.code = make_error_code(e), .reason = std::move(reason)}};
}

[[nodiscard]] inline auto fail_with(std::error_code ec, std::string reason)
    -> std::unexpected<Failure> {
  return std::unexpected{Failure{.code = ec, .reason = std::move(reason)}};
}

[[nodiscard]] inline auto fail_with(Failure f) -> std::unexpected<Failure> {
  return std::unexpected{std::move(f)};
}

} // namespace planq

template <> struct std::is_error_code_enum<planq::Error> : std::true_type {};
