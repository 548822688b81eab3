#pragma once

#include "calendarDate.hpp"
#include "constraintStore.hpp"
#include "randomSource.hpp"
#include "rotaConfig.hpp"
#include "rotaTypes.hpp"
#include "shiftCatalog.hpp"
#include "weekSchedule.hpp"

#include <sc-memory/utils/sc_logger.hpp>

#include <map>
#include <string>
#include <vector>

struct GenerationResult
{
  CalendarDate weekStart;
  WeekSchedule schedule;
  ShiftLoad load;
  UnassignedReasons reasons;
  // Неделя взята из архива без пересчёта
  bool fromArchive = false;
};

class ScheduleGenerator
{
public:
  ScheduleGenerator(RotaConfig const & config, RandomSource & random, utils::ScLogger & logger);

  GenerationResult Generate(
      CalendarDate const & weekStart,
      ShiftCatalog const & catalog,
      ConstraintStore const & constraints,
      ScheduleArchive const & archive) const;

private:
  // Последняя смена бармена на этой неделе
  struct LastShift
  {
    int dayIndex = 0;
    int endHour = 0;
  };

  enum class Exclusion
  {
    None,
    RestrictedDay,
    RestrictedShift,
    NotWhitelisted,
    MaxShifts,
    RestGap
  };

  Exclusion CheckEligibility(
      WorkerConstraints const & constraints,
      std::string const & dayName,
      int dayIndex,
      ShiftDefinition const & shift,
      int currentLoad,
      LastShift const * lastShift) const;

  std::vector<std::string> ApplySaturdayRule(
      std::vector<std::string> const & eligible,
      SaturdayStreakMap const & streaks) const;

  static std::string DescribeUnassigned(size_t workerCount, std::map<Exclusion, int> const & exclusions);

  RotaConfig m_config;
  RandomSource & m_random;
  utils::ScLogger & m_logger;
};
