#include "idkit/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace idkit::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;

  std::ostringstream oss;
  oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{3}))?Z?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::chrono::year_month_day date{
      std::chrono::year{std::stoi(match[1])},
      std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
      std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};
  if (!date.ok()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid date values: " + str));
  }

  int hours = std::stoi(match[4]);
  int minutes = std::stoi(match[5]);
  int seconds = std::stoi(match[6]);
  if (hours > 23 || minutes > 59 || seconds > 59) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  std::chrono::system_clock::time_point time_point = std::chrono::sys_days{date};
  time_point += std::chrono::hours(hours) + std::chrono::minutes(minutes) +
                std::chrono::seconds(seconds);

  // Add milliseconds if present
  if (match[7].matched) {
    time_point += std::chrono::milliseconds(std::stoi(match[7]));
  }

  return time_point;
}

}  // namespace idkit::util
