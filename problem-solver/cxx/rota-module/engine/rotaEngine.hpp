#pragma once

#include "calendarDate.hpp"
#include "constraintParser.hpp"
#include "constraintStore.hpp"
#include "randomSource.hpp"
#include "rotaConfig.hpp"
#include "scheduleGenerator.hpp"
#include "scheduleStore.hpp"
#include "shiftCatalog.hpp"
#include "weekCalendar.hpp"

#include <sc-memory/utils/sc_logger.hpp>

#include <string>
#include <vector>

// Состояние ротации одного бара и просматриваемая неделя
class RotaEngine
{
public:
  RotaEngine(RotaConfig const & config, RandomSource & random, Clock clock, utils::ScLogger & logger);

  void LoadState();
  void SaveConfiguration() const;

  GenerationResult const & GenerateWeek();
  GenerationResult const & NextWeek();
  GenerationResult const & PreviousWeek();
  GenerationResult const & CurrentWeek();

  void Swap(
      std::string const & firstDay,
      std::string const & firstShift,
      std::string const & secondDay,
      std::string const & secondShift);
  void Assign(std::string const & worker, std::string const & day, std::string const & shift);
  void Publish();

  SaturdayStreakMap SaturdayStreaks(bool includeCurrent) const;

  void AddWorker(std::string const & name, std::string const & constraintsText = "");
  void RemoveWorker(std::string const & name);
  void RenameWorker(std::string const & oldName, std::string const & newName);
  WorkerConstraints const & SetWorkerConstraints(std::string const & name, std::string const & constraintsText);

  void AddShift(std::string const & label, bool active = true);
  void RemoveShift(std::string const & label);
  void SetShiftActive(std::string const & label, bool active);

  ShiftCatalog const & GetShiftCatalog() const;
  ConstraintStore const & GetConstraintStore() const;
  ScheduleStore const & GetScheduleStore() const;
  WeekCalendar const & GetCalendar() const;
  bool IsViewedWeekPublished() const;

private:
  void EnsureEditable() const;
  std::vector<std::string> KnownWorkers() const;

  RotaConfig m_config;
  utils::ScLogger & m_logger;
  ConstraintParser m_parser;
  ScheduleGenerator m_generator;
  WeekCalendar m_calendar;
  ShiftCatalog m_catalog;
  ConstraintStore m_constraints;
  ScheduleStore m_store;

  GenerationResult m_current;
  bool m_generated = false;
};
