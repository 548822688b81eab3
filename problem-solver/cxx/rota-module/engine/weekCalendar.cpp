#include "weekCalendar.hpp"

WeekCalendar::WeekCalendar(Clock clock)
  : m_clock(std::move(clock))
{
  if (!m_clock)
    m_clock = DateUtils::SystemToday;
}

CalendarDate WeekCalendar::WeekStart(CalendarDate const & referenceDate)
{
  int const daysSinceSunday = DateUtils::GetWeekdayIndex(DateUtils::GetWeekday(referenceDate));
  return DateUtils::AddDays(referenceDate, -daysSinceSunday);
}

WeekDays WeekCalendar::DaysOf(CalendarDate const & weekStart)
{
  WeekDays days;
  days.reserve(7);
  for (int i = 0; i < 7; ++i)
    days.emplace_back(static_cast<Weekday>(i), DateUtils::AddDays(weekStart, i));
  return days;
}

CalendarDate WeekCalendar::GetToday() const
{
  return m_clock();
}

CalendarDate WeekCalendar::GetWeekStart() const
{
  return WeekStart(DateUtils::AddDays(GetToday(), 7L * m_offset));
}

WeekDays WeekCalendar::GetDays() const
{
  return DaysOf(GetWeekStart());
}

int WeekCalendar::GetOffset() const
{
  return m_offset;
}

CalendarDate WeekCalendar::Advance()
{
  ++m_offset;
  return GetWeekStart();
}

CalendarDate WeekCalendar::Previous()
{
  --m_offset;
  return GetWeekStart();
}

void WeekCalendar::Reset()
{
  m_offset = 0;
}
