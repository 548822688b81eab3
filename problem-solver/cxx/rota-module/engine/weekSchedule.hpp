#pragma once

#include "calendarDate.hpp"
#include "rotaTypes.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct ScheduleDay
{
  // Метка дня вида "Sunday 2026-10-18"
  std::string label;
  std::string weekday;
  // Смена -> бармен или UNASSIGNED
  std::map<std::string, std::string> slots;

  bool operator==(ScheduleDay const & other) const;
};

class WeekSchedule
{
public:
  static std::string MakeDayLabel(Weekday day, CalendarDate const & date);
  // Название дня недели из метки (первое слово), пустая строка если его нет
  static std::string WeekdayFromLabel(std::string const & label);

  ScheduleDay & AddDay(std::string const & label);
  std::vector<ScheduleDay> const & GetDays() const;

  // Поиск по названию дня недели или по полной метке
  ScheduleDay const * FindDay(std::string const & day) const;

  bool HasSlot(std::string const & day, std::string const & shift) const;
  std::string const & GetOccupant(std::string const & day, std::string const & shift) const;
  void SetOccupant(std::string const & day, std::string const & shift, std::string const & worker);

  size_t CountSlots() const;
  size_t CountUnassigned() const;
  ShiftLoad CountLoad() const;
  std::set<std::string> GetWorkers() const;

  // Бармены субботы; std::nullopt, если в неделе нет субботы
  std::optional<std::set<std::string>> GetSaturdayWorkers() const;

  bool IsEmpty() const;
  bool operator==(WeekSchedule const & other) const;
  bool operator!=(WeekSchedule const & other) const;

private:
  std::optional<size_t> FindDayIndex(std::string const & day) const;
  ScheduleDay * FindMutableDay(std::string const & day);

  std::vector<ScheduleDay> m_days;
};

// Опубликованные недели: дата воскресенья (YYYY-MM-DD) -> расписание
using ScheduleArchive = std::map<std::string, WeekSchedule>;
