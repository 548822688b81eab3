#pragma once

#include <functional>
#include <optional>
#include <string>

enum class Weekday
{
  Sunday = 0,
  Monday,
  Tuesday,
  Wednesday,
  Thursday,
  Friday,
  Saturday
};

struct CalendarDate
{
  int year = 1970;
  int month = 1;
  int day = 1;

  bool operator==(CalendarDate const & other) const;
  bool operator!=(CalendarDate const & other) const;
  bool operator<(CalendarDate const & other) const;
  bool operator<=(CalendarDate const & other) const;
  bool operator>(CalendarDate const & other) const;
};

// Источник текущей даты; в тестах подменяется фиксированной датой
using Clock = std::function<CalendarDate()>;

class DateUtils
{
public:
  static long ToDays(CalendarDate const & date);
  static CalendarDate FromDays(long days);
  static CalendarDate AddDays(CalendarDate const & date, long days);
  static Weekday GetWeekday(CalendarDate const & date);

  // Формат YYYY-MM-DD
  static std::string ToIsoString(CalendarDate const & date);
  static std::optional<CalendarDate> ParseIsoDate(std::string const & str);

  static std::string GetWeekdayName(Weekday day);
  static std::optional<Weekday> ParseWeekday(std::string const & name);
  static int GetWeekdayIndex(Weekday day);

  static CalendarDate SystemToday();
};
