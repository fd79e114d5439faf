#pragma once

#include "snowgen/snowflake/snowflake.h"

#include <cstdint>
#include <ostream>

// execute_next: print `count` IDs from `generator`, one per line.
// execute_short: same, with 53-bit short IDs.
// Both return 0 on success, or print the ClockRegressionError to `err` and return 1.
// IDs printed before a failure stay printed.
int execute_next(snowgen::snowflake::Snowflake& generator, std::int64_t count, std::ostream& out,
                 std::ostream& err);
int execute_short(snowgen::snowflake::Snowflake& generator, std::int64_t count, std::ostream& out,
                  std::ostream& err);
