#pragma once

#include "calendarDate.hpp"
#include "rotaConfig.hpp"
#include "weekSchedule.hpp"

#include <sc-memory/utils/sc_logger.hpp>

#include <string>
#include <vector>

// Архив опубликованных недель. Повторная публикация недели отклоняется.
// Документ архива записывается до изменения состояния в памяти.
class ScheduleStore
{
public:
  ScheduleStore(RotaConfig const & config, utils::ScLogger & logger);

  void Load();
  void SetArchive(ScheduleArchive const & archive);
  ScheduleArchive const & GetArchive() const;

  WeekSchedule const * FindWeek(CalendarDate const & weekStart) const;
  bool IsPublished(CalendarDate const & weekStart) const;

  // Бармены, чья серия суббот с учётом этой недели достигает предела публикации
  std::vector<std::string> FindViolators(
      CalendarDate const & weekStart,
      WeekSchedule const & schedule,
      std::vector<std::string> const & knownWorkers) const;

  void Publish(
      CalendarDate const & weekStart,
      WeekSchedule const & schedule,
      std::vector<std::string> const & knownWorkers);

private:
  RotaConfig m_config;
  utils::ScLogger & m_logger;
  ScheduleArchive m_archive;
};
