#include "dynamap/value/date_time.hpp"

#include <cctype>
#include <charconv>
#include <ctime>
#include <format>

namespace dynamap {

namespace {

using std::chrono::days;
using std::chrono::floor;
using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::minutes;
using std::chrono::seconds;

/// Parses exactly `width` digits at `pos`, advances pos on success.
bool ParseDigits(std::string_view text, size_t& pos, size_t width, uint32_t& out) {
  if (pos + width > text.size()) {
    return false;
  }
  uint32_t v = 0;
  for (size_t i = 0; i < width; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    v = v * 10 + static_cast<uint32_t>(c - '0');
  }
  out = v;
  pos += width;
  return true;
}

bool Expect(std::string_view text, size_t& pos, char c) {
  if (pos < text.size() && text[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

/// Parses "Z", "+hh:mm", "+hhmm" or "+hh" at pos.
bool ParseOffset(std::string_view text, size_t& pos, int32_t& offset_minutes) {
  if (Expect(text, pos, 'Z') || Expect(text, pos, 'z')) {
    offset_minutes = 0;
    return true;
  }
  if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-')) {
    return false;
  }
  int32_t sign = text[pos] == '-' ? -1 : 1;
  ++pos;
  uint32_t hh = 0;
  uint32_t mm = 0;
  if (!ParseDigits(text, pos, 2, hh)) {
    return false;
  }
  Expect(text, pos, ':');
  if (pos < text.size() && !ParseDigits(text, pos, 2, mm)) {
    return false;
  }
  if (hh > 23 || mm > 59) {
    return false;
  }
  offset_minutes = sign * static_cast<int32_t>(hh * 60 + mm);
  return true;
}

/// Parses 1 or 2 digits for a single letter token, exactly 2 otherwise.
bool ParseField(std::string_view text, size_t& pos, size_t run, uint32_t& out) {
  if (run == 2) {
    return ParseDigits(text, pos, 2, out);
  }
  if (!ParseDigits(text, pos, 1, out)) {
    return false;
  }
  uint32_t next = 0;
  if (ParseDigits(text, pos, 1, next)) {
    out = out * 10 + next;
  }
  return true;
}

/// Parses "+hh" or, with minutes, "+hh:mm".
bool ParseSignedOffset(std::string_view text, size_t& pos, bool with_minutes,
                       int32_t& offset_minutes) {
  if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-')) {
    return false;
  }
  int32_t sign = text[pos] == '-' ? -1 : 1;
  ++pos;
  uint32_t hh = 0;
  uint32_t mm = 0;
  if (!ParseDigits(text, pos, 2, hh)) {
    return false;
  }
  if (with_minutes && (!Expect(text, pos, ':') || !ParseDigits(text, pos, 2, mm))) {
    return false;
  }
  if (hh > 23 || mm > 59) {
    return false;
  }
  offset_minutes = sign * static_cast<int32_t>(hh * 60 + mm);
  return true;
}

std::string Pad(int64_t v, size_t width) {
  return std::format("{:0{}}", v, width);
}

} // namespace

//------------------------------------------------------------------------------
// TimezonePolicy
//------------------------------------------------------------------------------

Result<TimezonePolicy> TimezonePolicy::Parse(std::string_view text) {
  TimezonePolicy policy;
  if (text.empty() || text == "unspecified") {
    return policy;
  }
  if (text == "utc" || text == "UTC" || text == "Z") {
    policy.kind_ = TimezoneKind::kUtc;
    return policy;
  }
  if (text == "local") {
    policy.kind_ = TimezoneKind::kLocal;
    return policy;
  }

  size_t pos = 0;
  int32_t offset = 0;
  if (!ParseOffset(text, pos, offset) || pos != text.size()) {
    return Error::InvalidArgument(std::format("invalid timezone \"{}\"", text));
  }
  policy.kind_ = TimezoneKind::kFixedOffset;
  policy.offset_minutes_ = offset;
  return policy;
}

std::string TimezonePolicy::ToString() const {
  switch (kind_) {
  case TimezoneKind::kUnspecified:
    return "unspecified";
  case TimezoneKind::kUtc:
    return "utc";
  case TimezoneKind::kLocal:
    return "local";
  case TimezoneKind::kFixedOffset:
    return FormatOffset(offset_minutes_, false);
  }
  return "unknown";
}

//------------------------------------------------------------------------------
// DateTime
//------------------------------------------------------------------------------

DateTime DateTime::FromCivil(const Civil& civil, int32_t offset_minutes) {
  auto date = std::chrono::year{civil.year_} / std::chrono::month{civil.month_} /
              std::chrono::day{civil.day_};
  auto local = std::chrono::sys_days(date) + hours(civil.hour_) + minutes(civil.minute_) +
               seconds(civil.second_) + microseconds(civil.micros_);
  return DateTime(local - minutes(offset_minutes), offset_minutes);
}

Result<DateTime> DateTime::Parse(std::string_view text, int32_t default_offset_minutes) {
  auto fail = [&](std::string_view reason) {
    return Error::InvalidArgument(std::format("invalid datetime \"{}\": {}", text, reason));
  };

  size_t pos = 0;
  Civil civil;
  int32_t sign = 1;
  if (Expect(text, pos, '-')) {
    sign = -1;
  }
  uint32_t year = 0;
  if (!ParseDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
      !ParseDigits(text, pos, 2, civil.month_) || !Expect(text, pos, '-') ||
      !ParseDigits(text, pos, 2, civil.day_)) {
    return fail("expected yyyy-MM-dd");
  }
  civil.year_ = sign * static_cast<int32_t>(year);

  int32_t offset = default_offset_minutes;
  if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
    ++pos;
    if (!ParseDigits(text, pos, 2, civil.hour_) || !Expect(text, pos, ':') ||
        !ParseDigits(text, pos, 2, civil.minute_)) {
      return fail("expected HH:mm");
    }
    if (Expect(text, pos, ':')) {
      if (!ParseDigits(text, pos, 2, civil.second_)) {
        return fail("expected seconds");
      }
      if (Expect(text, pos, '.') || Expect(text, pos, ',')) {
        size_t digits = 0;
        uint32_t fraction = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
          // sub-microsecond digits are truncated
          if (digits < 6) {
            fraction = fraction * 10 + static_cast<uint32_t>(text[pos] - '0');
          }
          ++digits;
          ++pos;
        }
        if (digits == 0) {
          return fail("empty fraction");
        }
        for (size_t i = digits; i < 6; ++i) {
          fraction *= 10;
        }
        civil.micros_ = fraction;
      }
    }
  }

  if (pos < text.size() && !ParseOffset(text, pos, offset)) {
    return fail("invalid offset");
  }
  if (pos != text.size()) {
    return fail("trailing characters");
  }

  auto date = std::chrono::year{civil.year_} / std::chrono::month{civil.month_} /
              std::chrono::day{civil.day_};
  if (!date.ok() || civil.hour_ > 23 || civil.minute_ > 59 || civil.second_ > 59) {
    return fail("field out of range");
  }
  return FromCivil(civil, offset);
}

Result<DateTime> DateTime::ParseExact(std::string_view text, std::string_view pattern,
                                      int32_t default_offset_minutes) {
  if (pattern.empty() || pattern == "o" || pattern == "O") {
    return Parse(text, default_offset_minutes);
  }

  auto fail = [&](std::string_view reason) {
    return Error::InvalidArgument(
        std::format("invalid datetime \"{}\" for format \"{}\": {}", text, pattern, reason));
  };
  auto expect_literal = [&](size_t& pos, std::string_view literal) {
    if (text.substr(pos, literal.size()) != literal) {
      return false;
    }
    pos += literal.size();
    return true;
  };

  Civil civil;
  int32_t offset = default_offset_minutes;
  size_t pos = 0;
  size_t i = 0;
  while (i < pattern.size()) {
    char ch = pattern[i];

    if (ch == '\'' || ch == '"') {
      auto close = pattern.find(ch, i + 1);
      if (close == std::string_view::npos) {
        return Error::InvalidArgument(
            std::format("unterminated literal in datetime format \"{}\"", pattern));
      }
      if (!expect_literal(pos, pattern.substr(i + 1, close - i - 1))) {
        return fail(std::format("expected literal at offset {}", pos));
      }
      i = close + 1;
      continue;
    }
    if (ch == '\\' && i + 1 < pattern.size()) {
      if (!expect_literal(pos, pattern.substr(i + 1, 1))) {
        return fail(std::format("expected '{}' at offset {}", pattern[i + 1], pos));
      }
      i += 2;
      continue;
    }

    size_t run = 1;
    while (i + run < pattern.size() && pattern[i + run] == ch) {
      ++run;
    }
    auto token = std::string(run, ch);
    auto bad_run = [&]() {
      return Error::InvalidArgument(
          std::format("unsupported token \"{}\" in datetime format \"{}\"", token, pattern));
    };
    auto missing = [&]() { return fail(std::format("expected {} at offset {}", token, pos)); };

    switch (ch) {
    case 'y': {
      uint32_t year = 0;
      if (run == 4) {
        int32_t sign = Expect(text, pos, '-') ? -1 : 1;
        if (!ParseDigits(text, pos, 4, year)) {
          return missing();
        }
        civil.year_ = sign * static_cast<int32_t>(year);
      } else if (run == 2) {
        if (!ParseDigits(text, pos, 2, year)) {
          return missing();
        }
        civil.year_ = static_cast<int32_t>(year < 50 ? 2000 + year : 1900 + year);
      } else {
        return bad_run();
      }
      break;
    }
    case 'M':
    case 'd':
    case 'H':
    case 'm':
    case 's': {
      if (run > 2) {
        return bad_run();
      }
      auto* target = ch == 'M'   ? &civil.month_
                     : ch == 'd' ? &civil.day_
                     : ch == 'H' ? &civil.hour_
                     : ch == 'm' ? &civil.minute_
                                 : &civil.second_;
      if (!ParseField(text, pos, run, *target)) {
        return missing();
      }
      break;
    }
    case 'f': {
      if (run > 6) {
        return bad_run();
      }
      uint32_t fraction = 0;
      if (!ParseDigits(text, pos, run, fraction)) {
        return missing();
      }
      for (size_t k = run; k < 6; ++k) {
        fraction *= 10;
      }
      civil.micros_ = fraction;
      break;
    }
    case 'z':
      if (run > 3) {
        return bad_run();
      }
      if (!ParseSignedOffset(text, pos, run == 3, offset)) {
        return missing();
      }
      break;
    case 'K':
      if (run > 1) {
        return bad_run();
      }
      if (Expect(text, pos, 'Z')) {
        offset = 0;
      } else if (!ParseSignedOffset(text, pos, true, offset)) {
        return missing();
      }
      break;
    default:
      if (!expect_literal(pos, token)) {
        return missing();
      }
      break;
    }
    i += run;
  }

  if (pos != text.size()) {
    return fail("trailing characters");
  }
  auto date = std::chrono::year{civil.year_} / std::chrono::month{civil.month_} /
              std::chrono::day{civil.day_};
  if (!date.ok() || civil.hour_ > 23 || civil.minute_ > 59 || civil.second_ > 59) {
    return fail("field out of range");
  }
  return FromCivil(civil, offset);
}

DateTime DateTime::ToZone(const TimezonePolicy& policy) const {
  switch (policy.kind_) {
  case TimezoneKind::kUnspecified:
    return *this;
  case TimezoneKind::kUtc:
    return WithOffset(0);
  case TimezoneKind::kLocal:
    return WithOffset(LocalOffsetMinutes(instant_));
  case TimezoneKind::kFixedOffset:
    return WithOffset(policy.offset_minutes_);
  }
  return *this;
}

DateTime::Civil DateTime::ToCivil() const {
  auto local = instant_ + minutes(offset_minutes_);
  auto day_point = floor<days>(local);
  std::chrono::year_month_day ymd{day_point};
  std::chrono::hh_mm_ss<microseconds> hms{local - day_point};

  Civil civil;
  civil.year_ = static_cast<int32_t>(ymd.year());
  civil.month_ = static_cast<uint32_t>(ymd.month());
  civil.day_ = static_cast<uint32_t>(ymd.day());
  civil.hour_ = static_cast<uint32_t>(hms.hours().count());
  civil.minute_ = static_cast<uint32_t>(hms.minutes().count());
  civil.second_ = static_cast<uint32_t>(hms.seconds().count());
  civil.micros_ = static_cast<uint32_t>(hms.subseconds().count());
  return civil;
}

std::string DateTime::ToIsoString() const {
  auto c = ToCivil();
  return std::format("{}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}{}", Pad(c.year_, 4), c.month_, c.day_,
                     c.hour_, c.minute_, c.second_, c.micros_, FormatOffset(offset_minutes_, true));
}

Result<std::string> DateTime::Format(std::string_view pattern) const {
  if (pattern.empty() || pattern == "o" || pattern == "O") {
    return ToIsoString();
  }

  auto c = ToCivil();
  std::string out;
  size_t i = 0;
  while (i < pattern.size()) {
    char ch = pattern[i];

    if (ch == '\'' || ch == '"') {
      auto close = pattern.find(ch, i + 1);
      if (close == std::string_view::npos) {
        return Error::InvalidArgument(
            std::format("unterminated literal in datetime format \"{}\"", pattern));
      }
      out.append(pattern.substr(i + 1, close - i - 1));
      i = close + 1;
      continue;
    }
    if (ch == '\\' && i + 1 < pattern.size()) {
      out.push_back(pattern[i + 1]);
      i += 2;
      continue;
    }

    size_t run = 1;
    while (i + run < pattern.size() && pattern[i + run] == ch) {
      ++run;
    }

    auto bad_run = [&]() {
      return Error::InvalidArgument(
          std::format("unsupported token \"{}\" in datetime format \"{}\"", std::string(run, ch),
                      pattern));
    };

    switch (ch) {
    case 'y':
      if (run == 4) {
        out += Pad(c.year_, 4);
      } else if (run == 2) {
        out += Pad(c.year_ % 100, 2);
      } else {
        return bad_run();
      }
      break;
    case 'M':
      if (run > 2) {
        return bad_run();
      }
      out += Pad(c.month_, run);
      break;
    case 'd':
      if (run > 2) {
        return bad_run();
      }
      out += Pad(c.day_, run);
      break;
    case 'H':
      if (run > 2) {
        return bad_run();
      }
      out += Pad(c.hour_, run);
      break;
    case 'm':
      if (run > 2) {
        return bad_run();
      }
      out += Pad(c.minute_, run);
      break;
    case 's':
      if (run > 2) {
        return bad_run();
      }
      out += Pad(c.second_, run);
      break;
    case 'f': {
      if (run > 6) {
        return bad_run();
      }
      auto micros = Pad(c.micros_, 6);
      out.append(micros, 0, run);
      break;
    }
    case 'z': {
      if (run > 3) {
        return bad_run();
      }
      auto offset = FormatOffset(offset_minutes_, false);
      out += run == 3 ? offset : offset.substr(0, 3);
      break;
    }
    case 'K':
      if (run > 1) {
        return bad_run();
      }
      out += FormatOffset(offset_minutes_, true);
      break;
    default:
      out.append(run, ch);
      break;
    }
    i += run;
  }
  return out;
}

int32_t LocalOffsetMinutes(DateTime::Micros at) {
  auto secs = std::chrono::duration_cast<seconds>(at.time_since_epoch()).count();
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm local_tm{};
  if (localtime_r(&t, &local_tm) == nullptr) {
    return 0;
  }
  return static_cast<int32_t>(local_tm.tm_gmtoff / 60);
}

std::string FormatOffset(int32_t offset_minutes, bool zulu) {
  if (offset_minutes == 0 && zulu) {
    return "Z";
  }
  char sign = offset_minutes < 0 ? '-' : '+';
  int32_t abs_minutes = offset_minutes < 0 ? -offset_minutes : offset_minutes;
  return std::format("{}{:02}:{:02}", sign, abs_minutes / 60, abs_minutes % 60);
}

} // namespace dynamap
