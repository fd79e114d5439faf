#include "snowgen/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace snowgen::core {

std::int64_t default_epoch_seconds() {
  std::tm tm{};
  tm.tm_year = 2022 - 1900;
  tm.tm_mon = 3;  // April
  tm.tm_mday = 15;
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;  // let mktime decide
  return static_cast<std::int64_t>(std::mktime(&tm));
}

std::string format_local_datetime(std::int64_t unix_millis) {
  const auto seconds =
      std::chrono::floor<std::chrono::seconds>(std::chrono::milliseconds(unix_millis));
  const auto time_t_value = static_cast<std::time_t>(seconds.count());

  std::tm tm{};
  localtime_r(&time_t_value, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace snowgen::core
