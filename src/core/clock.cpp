#include "fetters/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fetters::core {

namespace {

std::string format_local_now(const char* format) {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);

  std::tm local{};
  localtime_r(&time_t_now, &local);

  std::ostringstream oss;
  oss << std::put_time(&local, format);
  return oss.str();
}

}  // namespace

std::string SystemClock::today() {
  return format_local_now("%Y-%m-%d");
}

std::string SystemClock::now_timestamp() {
  return format_local_now("%Y-%m-%d %H:%M:%S");
}

std::string FixedClock::today() {
  return fixed_timestamp_.substr(0, 10);
}

std::string FixedClock::now_timestamp() {
  return fixed_timestamp_;
}

}  // namespace fetters::core
