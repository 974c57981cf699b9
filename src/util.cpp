#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "util.hpp"
std::string getCurrentTimeAsString() {
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
  std::time_t time_now = std::chrono::system_clock::to_time_t(now);

  std::tm local_time{};
#ifdef _WIN32
  localtime_s(&local_time, &time_now);
#else
  localtime_r(&time_now, &local_time);
#endif

  std::stringstream ss;
  ss << std::setfill('0') << std::setw(2) << local_time.tm_hour << ":"
     << std::setw(2) << local_time.tm_min << ":" << std::setw(2)
     << local_time.tm_sec;

  return ss.str();
}
