#include "calendarDate.hpp"

#include "utils/stringFormatter.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace
{
std::array<std::string, 7> const WEEKDAY_NAMES = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

bool IsLeapYear(int year)
{
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month)
{
  static std::array<int, 12> const days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year))
    return 29;
  return days[month - 1];
}
}  // namespace

bool CalendarDate::operator==(CalendarDate const & other) const
{
  return year == other.year && month == other.month && day == other.day;
}

bool CalendarDate::operator!=(CalendarDate const & other) const
{
  return !(*this == other);
}

bool CalendarDate::operator<(CalendarDate const & other) const
{
  if (year != other.year)
    return year < other.year;
  if (month != other.month)
    return month < other.month;
  return day < other.day;
}

bool CalendarDate::operator<=(CalendarDate const & other) const
{
  return !(other < *this);
}

bool CalendarDate::operator>(CalendarDate const & other) const
{
  return other < *this;
}

// Количество дней от 1970-01-01 по пролептическому григорианскому календарю
long DateUtils::ToDays(CalendarDate const & date)
{
  long y = date.year;
  long const m = date.month;
  long const d = date.day;
  y -= m <= 2;
  long const era = (y >= 0 ? y : y - 399) / 400;
  long const yoe = y - era * 400;
  long const doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  long const doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CalendarDate DateUtils::FromDays(long days)
{
  days += 719468;
  long const era = (days >= 0 ? days : days - 146096) / 146097;
  long const doe = days - era * 146097;
  long const yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  long const doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  long const mp = (5 * doy + 2) / 153;
  long const d = doy - (153 * mp + 2) / 5 + 1;
  long const m = mp < 10 ? mp + 3 : mp - 9;
  long const y = yoe + era * 400 + (m <= 2);

  CalendarDate date;
  date.year = static_cast<int>(y);
  date.month = static_cast<int>(m);
  date.day = static_cast<int>(d);
  return date;
}

CalendarDate DateUtils::AddDays(CalendarDate const & date, long days)
{
  return FromDays(ToDays(date) + days);
}

Weekday DateUtils::GetWeekday(CalendarDate const & date)
{
  // 1970-01-01 был четвергом
  long const days = ToDays(date);
  long const index = ((days + 4) % 7 + 7) % 7;
  return static_cast<Weekday>(index);
}

std::string DateUtils::ToIsoString(CalendarDate const & date)
{
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
  return buffer;
}

std::optional<CalendarDate> DateUtils::ParseIsoDate(std::string const & str)
{
  std::string const trimmed = StringFormatter::Trim(str);
  if (trimmed.size() != 10 || trimmed[4] != '-' || trimmed[7] != '-')
    return std::nullopt;

  for (size_t i = 0; i < trimmed.size(); ++i)
  {
    if (i == 4 || i == 7)
      continue;
    if (!std::isdigit(static_cast<unsigned char>(trimmed[i])))
      return std::nullopt;
  }

  CalendarDate date;
  date.year = std::stoi(trimmed.substr(0, 4));
  date.month = std::stoi(trimmed.substr(5, 2));
  date.day = std::stoi(trimmed.substr(8, 2));

  if (date.month < 1 || date.month > 12)
    return std::nullopt;
  if (date.day < 1 || date.day > DaysInMonth(date.year, date.month))
    return std::nullopt;

  return date;
}

std::string DateUtils::GetWeekdayName(Weekday day)
{
  return WEEKDAY_NAMES[GetWeekdayIndex(day)];
}

std::optional<Weekday> DateUtils::ParseWeekday(std::string const & name)
{
  std::string const normalized = StringFormatter::Capitalize(StringFormatter::Trim(name));
  for (size_t i = 0; i < WEEKDAY_NAMES.size(); ++i)
  {
    if (WEEKDAY_NAMES[i] == normalized)
      return static_cast<Weekday>(i);
  }
  return std::nullopt;
}

int DateUtils::GetWeekdayIndex(Weekday day)
{
  return static_cast<int>(day);
}

CalendarDate DateUtils::SystemToday()
{
  std::time_t const now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);

  CalendarDate date;
  date.year = local.tm_year + 1900;
  date.month = local.tm_mon + 1;
  date.day = local.tm_mday;
  return date;
}
