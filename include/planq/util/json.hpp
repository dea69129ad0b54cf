#pragma once

#include "planq/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace planq {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// Reads a JSON document into a glaze-described struct, ignoring unknown keys.
template <typename T>
[[nodiscard]] auto read_json_as(std::string_view input) -> Result<T> {
  T out{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(out, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(out));
}

template <typename T>
[[nodiscard]] auto write_json_or(const T &value, std::string fallback)
    -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : std::move(fallback);
}

} // namespace planq
