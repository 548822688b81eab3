#include "streakTracker.hpp"

StreakTracker::StreakTracker(ScheduleArchive const & archive, utils::ScLogger & logger)
  : m_archive(archive)
  , m_logger(logger)
{
}

void StreakTracker::ApplyWeek(WeekSchedule const & week, SaturdayStreakMap & streaks)
{
  auto const saturdayWorkers = week.GetSaturdayWorkers();
  for (auto & [worker, streak] : streaks)
  {
    if (saturdayWorkers && saturdayWorkers->count(worker) > 0)
      ++streak;
    else
      streak = 0;
  }
}

SaturdayStreakMap StreakTracker::ComputeStreaks(
    std::vector<std::string> const & knownWorkers,
    CalendarDate const & viewedWeekStart,
    WeekSchedule const * extraWeek) const
{
  std::vector<WeekSchedule const *> weeks;
  for (auto const & [key, week] : m_archive)
  {
    auto const weekStart = DateUtils::ParseIsoDate(key);
    if (!weekStart)
    {
      m_logger.Warning("StreakTracker: skipping archived week with invalid key `", key, "`");
      continue;
    }
    if (*weekStart > viewedWeekStart)
      continue;

    weeks.push_back(&week);
  }
  if (extraWeek != nullptr)
    weeks.push_back(extraWeek);

  // Бармены, которых уже нет в списке, тоже отслеживаются по архиву
  SaturdayStreakMap streaks;
  for (auto const & worker : knownWorkers)
    streaks[worker] = 0;
  for (auto const * week : weeks)
  {
    for (auto const & worker : week->GetWorkers())
      streaks[worker] = 0;
  }

  for (auto const * week : weeks)
    ApplyWeek(*week, streaks);

  return streaks;
}

SaturdayStreakMap StreakTracker::GetSaturdayStreaks(
    std::vector<std::string> const & knownWorkers,
    CalendarDate const & viewedWeekStart,
    CalendarDate const & today,
    WeekSchedule const & currentWeek,
    bool includeCurrent) const
{
  // Опубликованная неделя уже учтена при проходе по архиву
  bool const alreadyArchived = m_archive.count(DateUtils::ToIsoString(viewedWeekStart)) > 0;
  bool const applyCurrent =
      includeCurrent && !alreadyArchived && viewedWeekStart <= today && !currentWeek.IsEmpty();
  return ComputeStreaks(knownWorkers, viewedWeekStart, applyCurrent ? &currentWeek : nullptr);
}
