#include "planq/util/id.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <random>

namespace planq::detail {

auto generate_short_uuid() -> std::string {
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}

// 48-bit millisecond prefix keeps ids roughly time ordered; the counter keeps
// ids created within the same millisecond ordered as well.
auto generate_uuid_v7_like() -> std::string {
  static std::atomic<std::uint16_t> seq{0};
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;
  const auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  const auto counter = seq.fetch_add(1, std::memory_order_relaxed);
  const auto rnd = dis(gen) & 0x0000'FFFF'FFFF'FFFFULL;
  return std::format("{:012x}-{:04x}-{:012x}", now_ms & 0xFFFF'FFFF'FFFFULL,
                     counter, rnd);
}

} // namespace planq::detail
