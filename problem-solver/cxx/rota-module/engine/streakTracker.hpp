#pragma once

#include "calendarDate.hpp"
#include "rotaTypes.hpp"
#include "weekSchedule.hpp"

#include <sc-memory/utils/sc_logger.hpp>

#include <string>
#include <vector>

// Субботние серии барменов по архиву в порядке дат.
// Неделя без бармена в субботу (или вовсе без субботы) обнуляет его серию.
class StreakTracker
{
public:
  StreakTracker(ScheduleArchive const & archive, utils::ScLogger & logger);

  // Серии по архиву и, если задана, ещё одной неделе поверх него
  SaturdayStreakMap ComputeStreaks(
      std::vector<std::string> const & knownWorkers,
      CalendarDate const & viewedWeekStart,
      WeekSchedule const * extraWeek = nullptr) const;

  // Текущая неделя учитывается, только если includeCurrent и неделя не в будущем
  SaturdayStreakMap GetSaturdayStreaks(
      std::vector<std::string> const & knownWorkers,
      CalendarDate const & viewedWeekStart,
      CalendarDate const & today,
      WeekSchedule const & currentWeek,
      bool includeCurrent) const;

private:
  static void ApplyWeek(WeekSchedule const & week, SaturdayStreakMap & streaks);

  ScheduleArchive const & m_archive;
  utils::ScLogger & m_logger;
};
