#include "cronhive/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace cronhive::detail {

// Hex of the 48-bit wall-clock millisecond count, then 64 random bits.
auto time_ordered_suffix() -> std::string {
  thread_local std::mt19937_64 rng(std::random_device{}());
  const auto ms = std::chrono::floor<std::chrono::milliseconds>(
                      std::chrono::system_clock::now())
                      .time_since_epoch()
                      .count();
  return std::format("{:012x}{:016x}",
                     static_cast<std::uint64_t>(ms) & 0xFFFF'FFFF'FFFFULL,
                     rng());
}

} // namespace cronhive::detail
