#include "snowgen/snowflake/snowflake.h"

#include "snowgen/core/time.h"
#include "snowgen/snowflake/errors.h"
#include "snowgen/snowflake/layout.h"

#include <string>

namespace snowgen::snowflake {

namespace {

void require_in_range(const char* name, std::int64_t value, std::int64_t max) {
  if (value < 0 || value > max) {
    throw ConfigurationError(std::string(name) + " " + std::to_string(value) +
                             " is out of range [0, " + std::to_string(max) + "]");
  }
}

std::int64_t epoch_millis_from(std::int64_t epoch_seconds) {
  if (epoch_seconds < -kMaxEpochSeconds || epoch_seconds > kMaxEpochSeconds) {
    throw ConfigurationError("epoch_seconds " + std::to_string(epoch_seconds) +
                             " does not fit in milliseconds");
  }
  return epoch_seconds * 1000;
}

// Slice `width` characters of `binary` whose lowest character sits `low`
// positions from the right end. width < 0 takes everything above `low`.
std::string slice_from_right(const std::string& binary, std::size_t low, int width) {
  const std::size_t length = binary.size();
  if (low >= length) {
    return "";
  }
  const std::size_t end = length - low;
  std::size_t begin = 0;
  if (width >= 0 && static_cast<std::size_t>(width) < end) {
    begin = end - static_cast<std::size_t>(width);
  }
  return binary.substr(begin, end - begin);
}

}  // namespace

Snowflake::Snowflake(SnowflakeOptions options)
    : Snowflake(options, core::system_clock(), random_sequence_seed()) {}

Snowflake::Snowflake(SnowflakeOptions options, core::IClock& clock, ISequenceSeed& sequence_seed)
    : clock_(&clock),
      sequence_seed_(&sequence_seed),
      epoch_(epoch_millis_from(options.epoch_seconds.value_or(core::default_epoch_seconds()))),
      worker_id_(options.worker_id),
      datacenter_id_(options.datacenter_id),
      last_timestamp_(epoch_) {
  require_in_range("worker_id", worker_id_, kMaxWorkerId);
  require_in_range("datacenter_id", datacenter_id_, kMaxDatacenterId);
}

std::uint64_t Snowflake::next() {
  std::int64_t suspended_millis = 0;

  while (true) {
    const std::int64_t now = timestamp();

    // Clock moved backward: wait it out if the gap is small enough.
    if (now < last_timestamp_) {
      const std::int64_t wait = last_timestamp_ - now;
      if (wait > kClockRegressionTimeoutMillis ||
          suspended_millis + wait > kClockRegressionTimeoutMillis) {
        throw ClockRegressionError(last_timestamp_, kClockRegressionTimeoutMillis);
      }
      clock_->sleep_for_millis(wait);
      suspended_millis += wait;
      continue;
    }

    if (now == last_timestamp_) {
      // Sequence space for this millisecond is used up. The sequence stays
      // saturated until the clock advances, so a retry within the same
      // millisecond cannot reissue an earlier sequence value.
      if (sequence_ >= kMaxSequence) {
        if (suspended_millis + 1 > kClockRegressionTimeoutMillis) {
          throw ClockRegressionError(last_timestamp_, kClockRegressionTimeoutMillis);
        }
        clock_->sleep_for_millis(1);
        suspended_millis += 1;
        continue;
      }
      ++sequence_;
    } else {
      sequence_ = sequence_seed_->initial_sequence();
    }

    last_timestamp_ = now;
    return to_snowflake_id(now - epoch_, sequence_);
  }
}

std::uint64_t Snowflake::to_snowflake_id(std::int64_t relative_timestamp,
                                         std::int64_t sequence) const {
  return encode_fields(SnowflakeFields{relative_timestamp, datacenter_id_, worker_id_, sequence});
}

ParsedSnowflake Snowflake::parse(std::uint64_t id) const {
  const SnowflakeFields fields = decode_fields(id);

  ParsedSnowflake parsed;
  parsed.binary = to_binary_string(id);
  parsed.binary_length = static_cast<std::int64_t>(parsed.binary.size());
  parsed.binary_timestamp = slice_from_right(parsed.binary, kTimestampShift, -1);
  parsed.binary_sequence = slice_from_right(parsed.binary, 0, kSequenceBits);
  parsed.binary_worker_id = slice_from_right(parsed.binary, kWorkerIdShift, kWorkerIdBits);
  parsed.binary_datacenter_id =
      slice_from_right(parsed.binary, kDatacenterIdShift, kDatacenterIdBits);
  parsed.timestamp = fields.timestamp;
  parsed.sequence = fields.sequence;
  parsed.worker_id = fields.worker_id;
  parsed.datacenter_id = fields.datacenter_id;
  parsed.epoch = epoch_;
  parsed.datetime = core::format_local_datetime(fields.timestamp + epoch_);
  return parsed;
}

std::uint64_t Snowflake::short_id() {
  const ParsedSnowflake parsed = parse(next());
  return (static_cast<std::uint64_t>(parsed.timestamp) << kSequenceBits) |
         static_cast<std::uint64_t>(parsed.sequence);
}

std::int64_t Snowflake::timestamp() {
  return clock_->now_unix_millis();
}

}  // namespace snowgen::snowflake
