#pragma once

#include "calendarDate.hpp"

#include <utility>
#include <vector>

using WeekDays = std::vector<std::pair<Weekday, CalendarDate>>;

class WeekCalendar
{
public:
  explicit WeekCalendar(Clock clock);

  // Воскресенье той недели, в которую попадает дата
  static CalendarDate WeekStart(CalendarDate const & referenceDate);
  static WeekDays DaysOf(CalendarDate const & weekStart);

  CalendarDate GetToday() const;
  CalendarDate GetWeekStart() const;
  WeekDays GetDays() const;
  int GetOffset() const;

  CalendarDate Advance();
  CalendarDate Previous();
  void Reset();

private:
  Clock m_clock;
  int m_offset = 0;
};
