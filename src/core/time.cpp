#include "sfid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sfid::core {

std::string format_iso8601(const Timestamp ts) {
  const auto whole_seconds = std::chrono::floor<std::chrono::seconds>(ts);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts - whole_seconds).count();
  const auto time_t_value = Clock::to_time_t(whole_seconds);

  // std::gmtime returns a shared buffer; copy it before anything else can touch it.
  const std::tm* const utc_ptr = std::gmtime(&time_t_value);
  if (utc_ptr == nullptr) {
    throw std::out_of_range("format_iso8601: time not representable as a calendar date");
  }
  const std::tm utc = *utc_ptr;

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace sfid::core
