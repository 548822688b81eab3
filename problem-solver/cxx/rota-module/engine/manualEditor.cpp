#include "manualEditor.hpp"
#include "rotaExceptions.hpp"

#include "utils/stringFormatter.hpp"

ManualEditor::ManualEditor(WeekSchedule & schedule, ShiftLoad & load, UnassignedReasons * reasons)
  : m_schedule(schedule)
  , m_load(load)
  , m_reasons(reasons)
{
}

void ManualEditor::EnsureTracked(std::string const & worker, int slots) const
{
  if (worker == UNASSIGNED)
    return;

  auto const it = m_load.find(worker);
  if (it == m_load.cend() || it->second < slots)
    SC_THROW_EXCEPTION(RotaValidationException, "Load of `" << worker << "` is out of sync with the schedule");
}

void ManualEditor::Release(std::string const & worker)
{
  if (worker != UNASSIGNED)
    --m_load[worker];
}

void ManualEditor::Occupy(std::string const & worker)
{
  if (worker != UNASSIGNED)
    ++m_load[worker];
}

std::string ManualEditor::ReasonKey(std::string const & day, std::string const & shift) const
{
  ScheduleDay const * scheduleDay = m_schedule.FindDay(day);
  return MakeSlotKey(scheduleDay != nullptr ? scheduleDay->weekday : day, shift);
}

void ManualEditor::Swap(
    std::string const & firstDay,
    std::string const & firstShift,
    std::string const & secondDay,
    std::string const & secondShift)
{
  // Копии: SetOccupant перезаписывает значения, на которые указывают ссылки
  std::string const first = m_schedule.GetOccupant(firstDay, firstShift);
  std::string const second = m_schedule.GetOccupant(secondDay, secondShift);

  if (ReasonKey(firstDay, firstShift) == ReasonKey(secondDay, secondShift))
    return;

  EnsureTracked(first, first == second ? 2 : 1);
  EnsureTracked(second, first == second ? 2 : 1);

  Release(first);
  Release(second);

  m_schedule.SetOccupant(firstDay, firstShift, second);
  m_schedule.SetOccupant(secondDay, secondShift, first);

  Occupy(second);
  Occupy(first);

  // Причина пустого слота переезжает вместе с ним
  if (m_reasons != nullptr)
  {
    std::string const firstKey = ReasonKey(firstDay, firstShift);
    std::string const secondKey = ReasonKey(secondDay, secondShift);
    if (firstKey != secondKey)
    {
      auto const firstReason = m_reasons->find(firstKey);
      auto const secondReason = m_reasons->find(secondKey);
      std::string const movedToSecond = firstReason != m_reasons->end() ? firstReason->second : "";
      std::string const movedToFirst = secondReason != m_reasons->end() ? secondReason->second : "";

      m_reasons->erase(firstKey);
      m_reasons->erase(secondKey);
      if (!movedToFirst.empty())
        (*m_reasons)[firstKey] = movedToFirst;
      if (!movedToSecond.empty())
        (*m_reasons)[secondKey] = movedToSecond;
    }
  }
}

void ManualEditor::OverrideAssign(std::string const & worker, std::string const & day, std::string const & shift)
{
  if (StringFormatter::Trim(worker).empty())
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender name must not be empty");

  std::string const previous = m_schedule.GetOccupant(day, shift);

  EnsureTracked(previous, 1);
  Release(previous);
  m_schedule.SetOccupant(day, shift, worker);
  Occupy(worker);

  if (m_reasons != nullptr && worker != UNASSIGNED)
    m_reasons->erase(ReasonKey(day, shift));
}
