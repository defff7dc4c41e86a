#include "time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace registry::util {

TimePoint Now() {
  return Clock::now();
}

std::string FormatIso8601(TimePoint tp) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  const std::time_t seconds = static_cast<std::time_t>(millis / 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (millis % 1000) << 'Z';
  return out.str();
}

TimePoint ParseIso8601(const std::string& text) {
  std::tm utc{};
  std::istringstream in(text);
  in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    throw std::invalid_argument("invalid ISO-8601 timestamp: " + text);
  }

  int millis = 0;
  if (in.peek() == '.') {
    in.get();
    std::string digits;
    while (digits.size() < 3 && std::isdigit(in.peek())) {
      digits.push_back(static_cast<char>(in.get()));
    }
    if (digits.empty()) {
      throw std::invalid_argument("invalid ISO-8601 fraction: " + text);
    }
    digits.resize(3, '0');
    millis = std::stoi(digits);
  }
  if (in.get() != 'Z') {
    throw std::invalid_argument("ISO-8601 timestamp must be UTC: " + text);
  }

  return Clock::from_time_t(timegm(&utc)) + std::chrono::milliseconds(millis);
}

} // namespace registry::util
