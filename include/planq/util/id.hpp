#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace planq {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

// Phantom type tags for type-safe ID disambiguation
struct PlanTag {};
struct TaskTag {};
struct RunTag {};
struct EventTag {};

// Type-safe ID wrapper using phantom type pattern
// Prevents accidental mixing of different ID types at compile time
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using PlanId = TypedId<PlanTag>;
using TaskId = TypedId<TaskTag>;
using RunId = TypedId<RunTag>;
using EventId = TypedId<EventTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace planq

// `is_avalanching` lets ankerl::unordered_dense::hash delegate to
// std::hash<TypedId<T>> instead of hashing the std::string object bytes.
template <typename Tag> struct std::hash<planq::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const planq::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<planq::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const planq::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace planq {

namespace detail {
[[nodiscard]] auto generate_short_uuid() -> std::string;
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

inline auto generate_run_id() -> RunId {
  return RunId{detail::generate_uuid_v7_like()};
}

inline auto generate_event_id() -> EventId {
  return EventId{detail::generate_uuid_v7_like()};
}

} // namespace planq
