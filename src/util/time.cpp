#include "hlid/util/time.hpp"

#include <iomanip>
#include <regex>
#include <sstream>

namespace hlid::util {

namespace {

using std::chrono::days;
using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::nanoseconds;
using std::chrono::seconds;
using std::chrono::sys_days;

constexpr int kMinYear = 1970;
constexpr int kMaxYear = 9999;
constexpr unsigned kTicksPerSecond = 10000;

}  // namespace

TickTime Time::toTicks(std::chrono::system_clock::time_point time) {
  return std::chrono::floor<Ticks>(time);
}

TickTime Time::minTime() {
  return TickTime{Ticks{0}};
}

TickTime Time::maxTime() {
  sys_days last_day{std::chrono::year{kMaxYear} / std::chrono::December / 31};
  return TickTime{last_day + days{1}} - Ticks{1};
}

bool Time::inRange(TickTime time) {
  return time >= minTime() && time <= maxTime();
}

DateTime Time::toDateTime(TickTime time) {
  auto day_point = std::chrono::floor<days>(time);
  std::chrono::year_month_day ymd{day_point};
  std::chrono::hh_mm_ss<Ticks> hms{time - day_point};

  DateTime fields;
  fields.year = static_cast<int>(ymd.year());
  fields.month = static_cast<unsigned>(ymd.month());
  fields.day = static_cast<unsigned>(ymd.day());
  fields.hour = static_cast<unsigned>(hms.hours().count());
  fields.minute = static_cast<unsigned>(hms.minutes().count());
  fields.second = static_cast<unsigned>(hms.seconds().count());
  fields.tick = static_cast<unsigned>(hms.subseconds().count());
  return fields;
}

Result<TickTime> Time::fromDateTime(const DateTime& fields) {
  if (fields.year < kMinYear || fields.year > kMaxYear) {
    return makeErrorResult<TickTime>(ErrorCode::kOutOfRange,
                                     "Year out of range: " + std::to_string(fields.year));
  }

  std::chrono::year_month_day ymd{std::chrono::year{fields.year},
                                  std::chrono::month{fields.month},
                                  std::chrono::day{fields.day}};
  if (!ymd.ok()) {
    return makeErrorResult<TickTime>(ErrorCode::kFormatError, "Invalid calendar date");
  }
  if (fields.hour > 23 || fields.minute > 59 || fields.second > 59) {
    return makeErrorResult<TickTime>(ErrorCode::kFormatError, "Invalid time of day");
  }
  if (fields.tick >= kTicksPerSecond) {
    return makeErrorResult<TickTime>(ErrorCode::kFormatError,
                                     "Sub-second value out of range: " + std::to_string(fields.tick));
  }

  return TickTime{sys_days{ymd}} + hours{fields.hour} + minutes{fields.minute} +
         seconds{fields.second} + Ticks{fields.tick};
}

double Time::toSeconds(TickTime time) {
  return std::chrono::duration<double>(time.time_since_epoch()).count();
}

std::string Time::toRfc3339(TickTime time) {
  auto fields = toDateTime(time);

  std::ostringstream oss;
  oss << std::setfill('0')
      << std::setw(4) << fields.year << '-'
      << std::setw(2) << fields.month << '-'
      << std::setw(2) << fields.day << 'T'
      << std::setw(2) << fields.hour << ':'
      << std::setw(2) << fields.minute << ':'
      << std::setw(2) << fields.second << '.'
      << std::setw(4) << fields.tick << 'Z';

  return oss.str();
}

Result<TickTime> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?([Zz]|[+-]\d{2}:\d{2}))");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format (zone designator required): " + str));
  }

  int year = std::stoi(match[1]);
  if (year < kMinYear || year > kMaxYear) {
    return std::unexpected(makeError(ErrorCode::kOutOfRange,
                                     "Year out of range: " + std::to_string(year)));
  }

  std::chrono::year_month_day ymd{std::chrono::year{year},
                                  std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
                                  std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};
  int hour = std::stoi(match[4]);
  int minute = std::stoi(match[5]);
  int second = std::stoi(match[6]);

  if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  // Digits beyond the fourth are below tick resolution and are truncated
  Ticks fraction{0};
  if (match[7].matched) {
    std::string digits = match[7].str();
    digits.resize(4, '0');
    fraction = Ticks{std::stoll(digits)};
  }

  minutes offset{0};
  std::string zone = match[8].str();
  if (zone != "Z" && zone != "z") {
    int offset_hours = std::stoi(zone.substr(1, 2));
    int offset_minutes = std::stoi(zone.substr(4, 2));
    if (offset_hours > 23 || offset_minutes > 59) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid UTC offset: " + zone));
    }
    offset = hours{offset_hours} + minutes{offset_minutes};
    if (zone[0] == '-') {
      offset = -offset;
    }
  }

  auto local = std::chrono::sys_seconds{sys_days{ymd}} + hours{hour} + minutes{minute} +
               seconds{second};
  return TickTime{local - offset} + fraction;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

std::string Time::formatDuration(std::chrono::nanoseconds duration) {
  std::ostringstream oss;

  if (duration < nanoseconds::zero()) {
    oss << '-';
    duration = -duration;
  }

  auto day_count = std::chrono::duration_cast<days>(duration);
  duration -= day_count;
  auto hour_count = std::chrono::duration_cast<hours>(duration);
  duration -= hour_count;
  auto minute_count = std::chrono::duration_cast<minutes>(duration);
  duration -= minute_count;
  auto second_count = std::chrono::duration_cast<seconds>(duration);
  duration -= second_count;
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration);

  bool has_larger_unit = day_count.count() > 0 || hour_count.count() > 0 || minute_count.count() > 0;

  if (day_count.count() > 0) {
    oss << day_count.count() << "d ";
  }
  if (hour_count.count() > 0) {
    oss << hour_count.count() << "h ";
  }
  if (minute_count.count() > 0) {
    oss << minute_count.count() << "m ";
  }
  if (second_count.count() > 0 || !has_larger_unit) {
    oss << second_count.count();
    if (milliseconds.count() > 0 && !has_larger_unit) {
      oss << "." << std::setfill('0') << std::setw(3) << milliseconds.count();
    }
    oss << "s";
  }

  std::string result = oss.str();
  if (!result.empty() && result.back() == ' ') {
    result.pop_back();
  }

  return result.empty() ? "0s" : result;
}

}  // namespace hlid::util
