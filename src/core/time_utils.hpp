#ifndef CELLWATCH_CORE_TIME_UTILS_HPP_
#define CELLWATCH_CORE_TIME_UTILS_HPP_

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace cellwatch::core {

using TimePoint = std::chrono::system_clock::time_point;

namespace detail {

inline bool ToUtcTm(TimePoint timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

inline bool ParseFixedDigits(std::string_view text, std::size_t offset, std::size_t count,
                             int& value) {
  if (offset + count > text.size()) {
    return false;
  }
  value = 0;
  for (std::size_t i = offset; i < offset + count; ++i) {
    const char c = text[i];
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  return true;
}

} // namespace detail

// Canonical UTC timestamp used by log lines and summary artifacts.
inline std::string FormatUtcTimestamp(TimePoint timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Telemetry datetime column format, second precision: "YYYY-MM-DD HH:MM:SS".
inline std::string FormatTelemetryDateTime(TimePoint timestamp) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }
  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

// Accepts "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DDTHH:MM:SS". Values are UTC.
inline std::optional<TimePoint> ParseTelemetryDateTime(std::string_view text) {
  if (text.size() != 19U || text[4] != '-' || text[7] != '-' ||
      (text[10] != ' ' && text[10] != 'T') || text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!detail::ParseFixedDigits(text, 0, 4, year) ||
      !detail::ParseFixedDigits(text, 5, 2, month) ||
      !detail::ParseFixedDigits(text, 8, 2, day) ||
      !detail::ParseFixedDigits(text, 11, 2, hour) ||
      !detail::ParseFixedDigits(text, 14, 2, minute) ||
      !detail::ParseFixedDigits(text, 17, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 59) {
    return std::nullopt;
  }

  std::tm utc_time{};
  utc_time.tm_year = year - 1900;
  utc_time.tm_mon = month - 1;
  utc_time.tm_mday = day;
  utc_time.tm_hour = hour;
  utc_time.tm_min = minute;
  utc_time.tm_sec = second;

#if defined(_WIN32)
  const std::time_t epoch_seconds = _mkgmtime(&utc_time);
#else
  const std::time_t epoch_seconds = timegm(&utc_time);
#endif
  // timegm normalizes out-of-range fields (e.g. Feb 31); reject those.
  if (utc_time.tm_year != year - 1900 || utc_time.tm_mon != month - 1 ||
      utc_time.tm_mday != day || utc_time.tm_hour != hour || utc_time.tm_min != minute ||
      utc_time.tm_sec != second) {
    return std::nullopt;
  }
  // -1 is also the failure sentinel; it is only valid for the second before
  // the epoch.
  if (epoch_seconds == static_cast<std::time_t>(-1) &&
      !(year == 1969 && month == 12 && day == 31 && hour == 23 && minute == 59 &&
        second == 59)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(epoch_seconds);
}

// Time-of-week slot of a UTC timestamp: weekday 0 (Sunday) .. 6, hour 0 .. 23.
struct TimeOfWeek {
  int weekday = 0;
  int hour = 0;

  bool operator==(const TimeOfWeek& other) const = default;
};

inline TimeOfWeek UtcTimeOfWeek(TimePoint timestamp) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return {};
  }
  return {.weekday = utc_time.tm_wday, .hour = utc_time.tm_hour};
}

} // namespace cellwatch::core

#endif // CELLWATCH_CORE_TIME_UTILS_HPP_
