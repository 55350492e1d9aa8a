#include "core/time_util.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kuberde {

std::string format_rfc3339(const Timestamp& ts) {
  std::time_t t = std::chrono::system_clock::to_time_t(ts);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::optional<Timestamp> parse_rfc3339(const std::string& str) {
  // 2006-01-02T15:04:05[.frac](Z|+hh:mm|-hh:mm)
  if (str.size() < 20) return std::nullopt;

  std::tm tm{};
  std::istringstream in(str.substr(0, 19));
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) return std::nullopt;

  size_t pos = 19;
  std::chrono::nanoseconds fraction{0};
  if (pos < str.size() && str[pos] == '.') {
    ++pos;
    int64_t scale = 100000000;
    int64_t value = 0;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
      if (scale > 0) {
        value += (str[pos] - '0') * scale;
        scale /= 10;
      }
      ++pos;
    }
    fraction = std::chrono::nanoseconds(value);
  }

  if (pos >= str.size()) return std::nullopt;

  int offset_seconds = 0;
  char tz = str[pos];
  if (tz == 'Z' || tz == 'z') {
    if (pos + 1 != str.size()) return std::nullopt;
  } else if (tz == '+' || tz == '-') {
    if (str.size() != pos + 6 || str[pos + 3] != ':') return std::nullopt;
    try {
      int hours = std::stoi(str.substr(pos + 1, 2));
      int minutes = std::stoi(str.substr(pos + 4, 2));
      offset_seconds = hours * 3600 + minutes * 60;
    } catch (const std::exception&) {
      return std::nullopt;
    }
    if (tz == '-') offset_seconds = -offset_seconds;
  } else {
    return std::nullopt;
  }

  std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;

  Timestamp ts = std::chrono::system_clock::from_time_t(t - offset_seconds);
  return ts + std::chrono::duration_cast<Timestamp::duration>(fraction);
}

std::optional<std::chrono::milliseconds> parse_duration(const std::string& str) {
  if (str.empty()) return std::nullopt;
  if (str == "0") return std::chrono::milliseconds(0);

  double total_ms = 0;
  size_t pos = 0;
  bool any = false;

  while (pos < str.size()) {
    size_t start = pos;
    while (pos < str.size() && (std::isdigit(static_cast<unsigned char>(str[pos])) || str[pos] == '.')) {
      ++pos;
    }
    if (start == pos) return std::nullopt;

    double value = 0;
    try {
      value = std::stod(str.substr(start, pos - start));
    } catch (const std::exception&) {
      return std::nullopt;
    }

    size_t unit_start = pos;
    while (pos < str.size() && std::isalpha(static_cast<unsigned char>(str[pos]))) {
      ++pos;
    }
    std::string unit = str.substr(unit_start, pos - unit_start);

    if (unit == "ms") {
      total_ms += value;
    } else if (unit == "s") {
      total_ms += value * 1000;
    } else if (unit == "m") {
      total_ms += value * 60 * 1000;
    } else if (unit == "h") {
      total_ms += value * 3600 * 1000;
    } else {
      return std::nullopt;
    }
    any = true;
  }

  if (!any) return std::nullopt;
  return std::chrono::milliseconds(static_cast<int64_t>(total_ms));
}

std::string format_duration(std::chrono::milliseconds d) {
  auto ms = d.count();
  if (ms == 0) return "0s";
  if (ms % 1000 != 0) return std::to_string(ms) + "ms";

  auto secs = ms / 1000;
  std::string out;
  if (secs >= 3600) {
    out += std::to_string(secs / 3600) + "h";
    secs %= 3600;
  }
  if (secs >= 60) {
    out += std::to_string(secs / 60) + "m";
    secs %= 60;
  }
  if (secs > 0) {
    out += std::to_string(secs) + "s";
  }
  return out;
}

int64_t to_unix_seconds(const Timestamp& ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp from_unix_seconds(int64_t epoch) {
  return Timestamp(std::chrono::seconds(epoch));
}

}  // namespace kuberde
