#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ulid {

// 128-bit big-endian value: 48-bit millisecond timestamp, then 80 random bits
using RawUlid = std::array<uint8_t, 16>;

static constexpr size_t RAW_LEN = 16;
static constexpr size_t TEXT_LEN = 26;
static constexpr size_t UUID_LEN = 36;
static constexpr size_t TIMESTAMP_LEN = 6;
static constexpr size_t RANDOM_LEN = RAW_LEN - TIMESTAMP_LEN;

static constexpr uint64_t MAX_TIMESTAMP = (uint64_t{1} << 48) - 1;

} // namespace ulid
