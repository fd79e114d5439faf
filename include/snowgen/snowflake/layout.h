#pragma once

#include <compare>
#include <cstdint>
#include <limits>

namespace snowgen::snowflake {

// Bit layout of a snowflake ID, high to low:
//   [41-bit relative timestamp][5-bit datacenter][5-bit worker][12-bit sequence]
// 63 bits in total; bit 63 is always zero for in-range input.
// Encode and decode both depend on these exact widths. Changing any of them
// breaks every ID already issued.
inline constexpr int kIdBits = 63;
inline constexpr int kTimestampBits = 41;
inline constexpr int kDatacenterIdBits = 5;
inline constexpr int kWorkerIdBits = 5;
inline constexpr int kSequenceBits = 12;

static_assert(kTimestampBits + kDatacenterIdBits + kWorkerIdBits + kSequenceBits == kIdBits);

inline constexpr int kWorkerIdShift = kSequenceBits;
inline constexpr int kDatacenterIdShift = kWorkerIdBits + kSequenceBits;
inline constexpr int kTimestampShift = kDatacenterIdBits + kWorkerIdBits + kSequenceBits;

inline constexpr std::int64_t kMaxWorkerId = (std::int64_t{1} << kWorkerIdBits) - 1;
inline constexpr std::int64_t kMaxDatacenterId = (std::int64_t{1} << kDatacenterIdBits) - 1;
inline constexpr std::int64_t kMaxSequence = (std::int64_t{1} << kSequenceBits) - 1;

// Longest a single next() call may spend suspended, and the largest backward
// clock step it will wait out.
inline constexpr std::int64_t kClockRegressionTimeoutMillis = 1000;

// Largest epoch, in Unix seconds, whose millisecond value fits std::int64_t.
inline constexpr std::int64_t kMaxEpochSeconds = std::numeric_limits<std::int64_t>::max() / 1000;

// SnowflakeFields is the decoded form of an ID, in layout order.
struct SnowflakeFields {
  std::int64_t timestamp{0};      // NOLINT(readability-identifier-naming)
  std::int64_t datacenter_id{0};  // NOLINT(readability-identifier-naming)
  std::int64_t worker_id{0};      // NOLINT(readability-identifier-naming)
  std::int64_t sequence{0};       // NOLINT(readability-identifier-naming)

  auto operator<=>(const SnowflakeFields&) const = default;
};

// encode_fields packs the four fields by shift-and-OR.
// No masking: a field wider than its slot spills into the neighbouring slot.
[[nodiscard]] constexpr std::uint64_t encode_fields(const SnowflakeFields& fields) {
  return (static_cast<std::uint64_t>(fields.timestamp) << kTimestampShift) |
         (static_cast<std::uint64_t>(fields.datacenter_id) << kDatacenterIdShift) |
         (static_cast<std::uint64_t>(fields.worker_id) << kWorkerIdShift) |
         static_cast<std::uint64_t>(fields.sequence);
}

// decode_fields is the arithmetic inverse of encode_fields for in-range input.
// The timestamp takes every bit above the datacenter slot.
[[nodiscard]] constexpr SnowflakeFields decode_fields(std::uint64_t id) {
  SnowflakeFields fields;
  fields.timestamp = static_cast<std::int64_t>(id >> kTimestampShift);
  fields.datacenter_id =
      static_cast<std::int64_t>((id >> kDatacenterIdShift) & static_cast<std::uint64_t>(kMaxDatacenterId));
  fields.worker_id =
      static_cast<std::int64_t>((id >> kWorkerIdShift) & static_cast<std::uint64_t>(kMaxWorkerId));
  fields.sequence = static_cast<std::int64_t>(id & static_cast<std::uint64_t>(kMaxSequence));
  return fields;
}

}  // namespace snowgen::snowflake
