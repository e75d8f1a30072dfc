#ifndef CAMCTL_CORE_TIME_UTILS_HPP_
#define CAMCTL_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace camctl::core {

// `YYYYmmdd_HHMMSS` in local time, for generated recording names.
inline std::string FormatLocalFileStamp(std::chrono::system_clock::time_point timestamp) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
  if (localtime_r(&epoch_seconds, &local_time) == nullptr) {
    return "";
  }
  std::ostringstream out;
  out << std::put_time(&local_time, "%Y%m%d_%H%M%S");
  return out.str();
}

// Fractional seconds since the epoch, as reported in status output.
inline double ToUnixSeconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration<double>(timestamp.time_since_epoch()).count();
}

} // namespace camctl::core

#endif // CAMCTL_CORE_TIME_UTILS_HPP_
