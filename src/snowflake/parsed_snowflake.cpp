#include "snowgen/snowflake/parsed_snowflake.h"

#include <bitset>

namespace snowgen::snowflake {

std::string to_binary_string(std::uint64_t id) {
  const std::string padded = std::bitset<64>(id).to_string();
  const auto first_one = padded.find('1');
  if (first_one == std::string::npos) {
    return "0";
  }
  return padded.substr(first_one);
}

nlohmann::json parsed_snowflake_to_json(const ParsedSnowflake& parsed) {
  nlohmann::json j;
  j["binary"] = parsed.binary;
  j["binary_datacenter_id"] = parsed.binary_datacenter_id;
  j["binary_length"] = parsed.binary_length;
  j["binary_sequence"] = parsed.binary_sequence;
  j["binary_timestamp"] = parsed.binary_timestamp;
  j["binary_worker_id"] = parsed.binary_worker_id;
  j["datacenter_id"] = parsed.datacenter_id;
  j["datetime"] = parsed.datetime;
  j["epoch"] = parsed.epoch;
  j["sequence"] = parsed.sequence;
  j["timestamp"] = parsed.timestamp;
  j["worker_id"] = parsed.worker_id;
  return j;
}

}  // namespace snowgen::snowflake
