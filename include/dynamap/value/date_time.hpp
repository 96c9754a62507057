#pragma once

#include "dynamap/base/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace dynamap {

/// Zone a datetime field is normalized to before formatting and re-attached
/// after parsing.
enum class TimezoneKind : uint8_t {
  /// Keep whatever offset the value carries.
  kUnspecified = 0,
  kUtc,
  /// The process local zone at the instant being converted.
  kLocal,
  kFixedOffset,
};

struct TimezonePolicy {
  TimezoneKind kind_ = TimezoneKind::kUnspecified;

  /// Only meaningful for kFixedOffset.
  int32_t offset_minutes_ = 0;

  /// Parses "utc", "local", "unspecified", "Z" or an offset like "+05:30".
  static Result<TimezonePolicy> Parse(std::string_view text);

  std::string ToString() const;

  bool operator==(const TimezonePolicy& other) const = default;
};

/// An instant with microsecond precision plus the UTC offset it is displayed
/// in. Two values are equal when both the instant and the offset match.
class DateTime {
public:
  using Micros = std::chrono::sys_time<std::chrono::microseconds>;

  struct Civil {
    int32_t year_ = 1970;
    uint32_t month_ = 1;
    uint32_t day_ = 1;
    uint32_t hour_ = 0;
    uint32_t minute_ = 0;
    uint32_t second_ = 0;
    uint32_t micros_ = 0;
  };

  DateTime() = default;

  explicit DateTime(Micros instant, int32_t offset_minutes = 0)
      : instant_(instant),
        offset_minutes_(offset_minutes) {
  }

  /// Creates a value from wall-clock fields observed at the given offset.
  static DateTime FromCivil(const Civil& civil, int32_t offset_minutes = 0);

  /// Parses ISO-8601 text: a date, optionally followed by 'T' or ' ', a time
  /// with optional fraction, and an optional 'Z' or +hh:mm offset. Text
  /// without an offset is read at default_offset_minutes.
  static Result<DateTime> Parse(std::string_view text, int32_t default_offset_minutes = 0);

  /// Parses text rendered by Format(pattern). Fields the pattern lacks keep
  /// their Civil defaults, two digit years fall in 1950..2049, and text is
  /// read at default_offset_minutes unless the pattern has an offset token.
  static Result<DateTime> ParseExact(std::string_view text, std::string_view pattern,
                                     int32_t default_offset_minutes = 0);

  Micros instant() const {
    return instant_;
  }

  int32_t offset_minutes() const {
    return offset_minutes_;
  }

  /// Same instant displayed at another offset.
  DateTime WithOffset(int32_t offset_minutes) const {
    return DateTime(instant_, offset_minutes);
  }

  /// Converts to the zone of the given policy, kUnspecified keeps the offset.
  DateTime ToZone(const TimezonePolicy& policy) const;

  /// Wall-clock fields at the value's own offset.
  Civil ToCivil() const;

  /// Canonical form: yyyy-MM-ddTHH:mm:ss.ffffff followed by Z or +hh:mm.
  std::string ToIsoString() const;

  /// Formats with a custom pattern. Supported tokens: yyyy, MM, dd, HH, mm,
  /// ss, f..ffffff, zzz, K, quoted literals, and the standard "o"/"O" pattern
  /// which equals the canonical form.
  Result<std::string> Format(std::string_view pattern) const;

  bool operator==(const DateTime& other) const = default;

private:
  Micros instant_{};
  int32_t offset_minutes_ = 0;
};

/// UTC offset of the process local zone at the given instant.
int32_t LocalOffsetMinutes(DateTime::Micros at);

/// Renders an offset as "+hh:mm", or "Z" for zero when zulu is set.
std::string FormatOffset(int32_t offset_minutes, bool zulu);

} // namespace dynamap
