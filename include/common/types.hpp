#pragma once

#include <chrono>
#include <cstdint>

namespace warden {

// Basic integer types
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

// Monotonic timestamp used for TTLs, breaker timers and durations
using timestamp_t = std::chrono::time_point<std::chrono::steady_clock>;

// Wall-clock timestamp used in error envelopes and logs
using wall_time_t = std::chrono::system_clock::time_point;

using Milliseconds = std::chrono::milliseconds;

// Branch prediction hints
#define WARDEN_LIKELY(x) __builtin_expect(!!(x), 1)
#define WARDEN_UNLIKELY(x) __builtin_expect(!!(x), 0)

} // namespace warden
