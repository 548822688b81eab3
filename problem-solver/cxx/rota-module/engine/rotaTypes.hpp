#pragma once

#include <map>
#include <set>
#include <string>

// Значение слота, на который никого не удалось поставить
inline std::string const UNASSIGNED = "Unassigned";

inline int const DEFAULT_MAX_SHIFTS = 5;

struct WorkerConstraints
{
  // Пустой список означает, что бармен может работать в любую смену
  std::set<std::string> allowedShifts;
  std::set<std::string> restrictedDays;
  std::set<std::string> restrictedShifts;
  int maxShifts = DEFAULT_MAX_SHIFTS;

  bool operator==(WorkerConstraints const & other) const
  {
    return allowedShifts == other.allowedShifts && restrictedDays == other.restrictedDays
           && restrictedShifts == other.restrictedShifts && maxShifts == other.maxShifts;
  }

  bool operator!=(WorkerConstraints const & other) const
  {
    return !(*this == other);
  }
};

// Бармен -> количество занятых слотов текущей недели
using ShiftLoad = std::map<std::string, int>;
// "день - смена" -> причина, по которой слот остался пустым
using UnassignedReasons = std::map<std::string, std::string>;
// Бармен -> число субботних недель подряд
using SaturdayStreakMap = std::map<std::string, int>;

inline std::string MakeSlotKey(std::string const & day, std::string const & shift)
{
  return day + " - " + shift;
}
