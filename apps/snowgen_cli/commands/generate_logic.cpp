#include "generate_logic.h"

#include "snowgen/snowflake/errors.h"

int execute_next(snowgen::snowflake::Snowflake& generator, std::int64_t count, std::ostream& out,
                 std::ostream& err) {
  try {
    for (std::int64_t i = 0; i < count; ++i) {
      out << generator.next() << "\n";
    }
  } catch (const snowgen::snowflake::ClockRegressionError& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

int execute_short(snowgen::snowflake::Snowflake& generator, std::int64_t count, std::ostream& out,
                  std::ostream& err) {
  try {
    for (std::int64_t i = 0; i < count; ++i) {
      out << generator.short_id() << "\n";
    }
  } catch (const snowgen::snowflake::ClockRegressionError& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
