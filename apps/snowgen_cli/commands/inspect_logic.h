#pragma once

#include "snowgen/snowflake/snowflake.h"

#include <cstdint>
#include <ostream>
#include <string>

// execute_parse: decode `id_text` (base-10) and print the record as pretty JSON.
//   Returns 1 if `id_text` is not an unsigned 64-bit integer.
// execute_encode: print the ID packed from a relative timestamp and sequence.
// execute_timestamp: print the generator's current clock reading (Unix ms).
int execute_parse(const snowgen::snowflake::Snowflake& generator, const std::string& id_text,
                  std::ostream& out, std::ostream& err);
int execute_encode(const snowgen::snowflake::Snowflake& generator, std::int64_t relative_timestamp,
                   std::int64_t sequence, std::ostream& out);
int execute_timestamp(snowgen::snowflake::Snowflake& generator, std::ostream& out);
