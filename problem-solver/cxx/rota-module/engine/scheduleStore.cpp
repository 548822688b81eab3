#include "scheduleStore.hpp"
#include "rotaExceptions.hpp"
#include "streakTracker.hpp"

#include "storage/rotaJsonStorage.hpp"

ScheduleStore::ScheduleStore(RotaConfig const & config, utils::ScLogger & logger)
  : m_config(config)
  , m_logger(logger)
{
}

void ScheduleStore::Load()
{
  m_archive = RotaJsonStorage::ArchiveFromJson(RotaJsonStorage::LoadDocument(m_config.archivePath, m_logger), m_logger);
  m_logger.Info("ScheduleStore: loaded ", m_archive.size(), " published weeks");
}

void ScheduleStore::SetArchive(ScheduleArchive const & archive)
{
  m_archive = archive;
}

ScheduleArchive const & ScheduleStore::GetArchive() const
{
  return m_archive;
}

WeekSchedule const * ScheduleStore::FindWeek(CalendarDate const & weekStart) const
{
  auto const it = m_archive.find(DateUtils::ToIsoString(weekStart));
  return it == m_archive.cend() ? nullptr : &it->second;
}

bool ScheduleStore::IsPublished(CalendarDate const & weekStart) const
{
  return FindWeek(weekStart) != nullptr;
}

std::vector<std::string> ScheduleStore::FindViolators(
    CalendarDate const & weekStart,
    WeekSchedule const & schedule,
    std::vector<std::string> const & knownWorkers) const
{
  StreakTracker const tracker(m_archive, m_logger);
  SaturdayStreakMap const streaks = tracker.ComputeStreaks(knownWorkers, weekStart, &schedule);

  std::vector<std::string> violators;
  for (auto const & [worker, streak] : streaks)
  {
    if (streak >= m_config.publishStreakLimit)
      violators.push_back(worker);
  }
  return violators;
}

void ScheduleStore::Publish(
    CalendarDate const & weekStart,
    WeekSchedule const & schedule,
    std::vector<std::string> const & knownWorkers)
{
  std::string const weekKey = DateUtils::ToIsoString(weekStart);
  if (m_archive.count(weekKey) > 0)
    SC_THROW_EXCEPTION(RotaValidationException, "Week " << weekKey << " is already published");
  if (schedule.IsEmpty())
    SC_THROW_EXCEPTION(RotaValidationException, "Week " << weekKey << " has no schedule to publish");

  std::vector<std::string> const violators = FindViolators(weekStart, schedule, knownWorkers);
  if (!violators.empty())
  {
    m_logger.Warning("ScheduleStore: publication of ", weekKey, " blocked for ", violators.size(), " bartenders");
    throw PublishBlockedException(violators);
  }

  if (!m_config.archivePath.empty())
  {
    ScheduleArchive updated = m_archive;
    updated[weekKey] = schedule;
    RotaJsonStorage::SaveDocument(m_config.archivePath, RotaJsonStorage::ArchiveToJson(updated));
  }

  m_archive[weekKey] = schedule;
  m_logger.Info("ScheduleStore: published week ", weekKey);
}
