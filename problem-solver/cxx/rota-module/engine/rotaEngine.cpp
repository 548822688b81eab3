#include "rotaEngine.hpp"
#include "manualEditor.hpp"
#include "rotaExceptions.hpp"
#include "streakTracker.hpp"

#include "storage/rotaJsonStorage.hpp"

#include <set>
#include <utility>

RotaEngine::RotaEngine(RotaConfig const & config, RandomSource & random, Clock clock, utils::ScLogger & logger)
  : m_config(config)
  , m_logger(logger)
  , m_parser(logger, config.defaultMaxShifts)
  , m_generator(config, random, logger)
  , m_calendar(std::move(clock))
  , m_constraints(config.defaultMaxShifts)
  , m_store(config, logger)
{
}

void RotaEngine::LoadState()
{
  m_constraints = RotaJsonStorage::ConstraintsFromJson(
      RotaJsonStorage::LoadDocument(m_config.constraintsPath, m_logger), m_logger, m_config.defaultMaxShifts);
  m_catalog =
      RotaJsonStorage::ShiftCatalogFromJson(RotaJsonStorage::LoadDocument(m_config.shiftsPath, m_logger), m_logger);
  m_store.Load();
  m_current = GenerationResult{};
  m_generated = false;

  m_logger.Info(
      "RotaEngine: loaded ",
      m_constraints.Size(),
      " bartenders, ",
      m_catalog.GetActiveShifts().size(),
      " active shifts");
}

void RotaEngine::SaveConfiguration() const
{
  if (!m_config.constraintsPath.empty())
    RotaJsonStorage::SaveDocument(m_config.constraintsPath, RotaJsonStorage::ConstraintsToJson(m_constraints));
  if (!m_config.shiftsPath.empty())
    RotaJsonStorage::SaveDocument(m_config.shiftsPath, RotaJsonStorage::ShiftCatalogToJson(m_catalog));
}

GenerationResult const & RotaEngine::GenerateWeek()
{
  m_current = m_generator.Generate(m_calendar.GetWeekStart(), m_catalog, m_constraints, m_store.GetArchive());
  m_generated = true;
  return m_current;
}

GenerationResult const & RotaEngine::NextWeek()
{
  m_calendar.Advance();
  return GenerateWeek();
}

GenerationResult const & RotaEngine::PreviousWeek()
{
  m_calendar.Previous();
  return GenerateWeek();
}

GenerationResult const & RotaEngine::CurrentWeek()
{
  if (!m_generated)
    return GenerateWeek();
  return m_current;
}

void RotaEngine::EnsureEditable() const
{
  if (!m_generated)
    SC_THROW_EXCEPTION(RotaValidationException, "No week has been generated yet");
  if (m_current.fromArchive || m_store.IsPublished(m_current.weekStart))
    SC_THROW_EXCEPTION(
        RotaValidationException,
        "Week " << DateUtils::ToIsoString(m_current.weekStart) << " is published and cannot be edited");
}

void RotaEngine::Swap(
    std::string const & firstDay,
    std::string const & firstShift,
    std::string const & secondDay,
    std::string const & secondShift)
{
  EnsureEditable();
  ManualEditor editor(m_current.schedule, m_current.load, &m_current.reasons);
  editor.Swap(firstDay, firstShift, secondDay, secondShift);
  m_logger.Debug("RotaEngine: swapped ", firstDay, " ", firstShift, " with ", secondDay, " ", secondShift);
}

void RotaEngine::Assign(std::string const & worker, std::string const & day, std::string const & shift)
{
  EnsureEditable();
  ManualEditor editor(m_current.schedule, m_current.load, &m_current.reasons);
  editor.OverrideAssign(worker, day, shift);
  m_logger.Debug("RotaEngine: assigned ", worker, " to ", day, " ", shift);
}

void RotaEngine::Publish()
{
  EnsureEditable();
  m_store.Publish(m_current.weekStart, m_current.schedule, KnownWorkers());
  m_current.fromArchive = true;
  m_current.reasons.clear();
}

SaturdayStreakMap RotaEngine::SaturdayStreaks(bool includeCurrent) const
{
  StreakTracker const tracker(m_store.GetArchive(), m_logger);
  return tracker.GetSaturdayStreaks(
      KnownWorkers(), m_calendar.GetWeekStart(), m_calendar.GetToday(), m_current.schedule, includeCurrent);
}

// Текущий список барменов и все, кто стоит в просматриваемой неделе
std::vector<std::string> RotaEngine::KnownWorkers() const
{
  std::set<std::string> workers;
  for (auto const & name : m_constraints.GetWorkerNames())
    workers.insert(name);
  for (auto const & worker : m_current.schedule.GetWorkers())
    workers.insert(worker);
  return {workers.cbegin(), workers.cend()};
}

void RotaEngine::AddWorker(std::string const & name, std::string const & constraintsText)
{
  m_constraints.AddWorker(name, m_parser.ParseConstraints(constraintsText));
}

void RotaEngine::RemoveWorker(std::string const & name)
{
  m_constraints.RemoveWorker(name);
}

void RotaEngine::RenameWorker(std::string const & oldName, std::string const & newName)
{
  m_constraints.RenameWorker(oldName, newName);
}

WorkerConstraints const & RotaEngine::SetWorkerConstraints(
    std::string const & name,
    std::string const & constraintsText)
{
  return m_constraints.ApplyText(name, constraintsText, m_parser);
}

void RotaEngine::AddShift(std::string const & label, bool active)
{
  m_catalog.AddShift(label, active);
}

void RotaEngine::RemoveShift(std::string const & label)
{
  m_catalog.RemoveShift(label);
}

void RotaEngine::SetShiftActive(std::string const & label, bool active)
{
  m_catalog.SetActive(label, active);
}

ShiftCatalog const & RotaEngine::GetShiftCatalog() const
{
  return m_catalog;
}

ConstraintStore const & RotaEngine::GetConstraintStore() const
{
  return m_constraints;
}

ScheduleStore const & RotaEngine::GetScheduleStore() const
{
  return m_store;
}

WeekCalendar const & RotaEngine::GetCalendar() const
{
  return m_calendar;
}

bool RotaEngine::IsViewedWeekPublished() const
{
  return m_store.IsPublished(m_calendar.GetWeekStart());
}
