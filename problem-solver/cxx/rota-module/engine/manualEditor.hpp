#pragma once

#include "rotaTypes.hpp"
#include "weekSchedule.hpp"

#include <string>

// Ручная правка неопубликованной недели без проверки ограничений барменов.
// Счётчики нагрузки всегда совпадают с подсчётом по слотам.
class ManualEditor
{
public:
  ManualEditor(WeekSchedule & schedule, ShiftLoad & load, UnassignedReasons * reasons = nullptr);

  // Обмен двух слотов; повторный вызов с теми же координатами возвращает исходное состояние
  void Swap(
      std::string const & firstDay,
      std::string const & firstShift,
      std::string const & secondDay,
      std::string const & secondShift);

  void OverrideAssign(std::string const & worker, std::string const & day, std::string const & shift);

private:
  void EnsureTracked(std::string const & worker, int slots) const;
  void Release(std::string const & worker);
  void Occupy(std::string const & worker);
  std::string ReasonKey(std::string const & day, std::string const & shift) const;

  WeekSchedule & m_schedule;
  ShiftLoad & m_load;
  UnassignedReasons * m_reasons;
};
