#include "inspect_logic.h"

#include "snowgen/core/numeric.h"
#include "snowgen/snowflake/parsed_snowflake.h"

#include <nlohmann/json.hpp>

int execute_parse(const snowgen::snowflake::Snowflake& generator, const std::string& id_text,
                  std::ostream& out, std::ostream& err) {
  const auto id = snowgen::core::parse_uint64(id_text);
  if (!id.has_value()) {
    err << "Invalid snowflake id: '" << id_text << "' is not an unsigned 64-bit integer\n";
    return 1;
  }

  const auto parsed = generator.parse(id.value());
  out << snowgen::snowflake::parsed_snowflake_to_json(parsed).dump(2) << "\n";
  return 0;
}

int execute_encode(const snowgen::snowflake::Snowflake& generator, std::int64_t relative_timestamp,
                   std::int64_t sequence, std::ostream& out) {
  out << generator.to_snowflake_id(relative_timestamp, sequence) << "\n";
  return 0;
}

int execute_timestamp(snowgen::snowflake::Snowflake& generator, std::ostream& out) {
  out << generator.timestamp() << "\n";
  return 0;
}
