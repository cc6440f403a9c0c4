#ifndef ALIAS_H
#define ALIAS_H

#include <chrono>
#include <cstddef>
#include <cstdint>

using byte = uint8_t;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using usize = u64;

constexpr u64 u64_max = 0xFFFFFFFFFFFFFFFF;

using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

using f64 = double;

// Wall-clock instant in UTC, microsecond resolution.
using TimePoint =
    std::chrono::sys_time<std::chrono::microseconds>;

#endif
