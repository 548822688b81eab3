#pragma once

#include <map>
#include <string>
#include <vector>

struct ShiftHours
{
  int start = 0;
  // Для ночной смены конец переносится на следующие сутки: "16-1" -> 16..25
  int end = 0;
};

struct ShiftDefinition
{
  std::string label;
  bool active = true;
  ShiftHours hours;
};

class ShiftCatalog
{
public:
  static ShiftHours Parse(std::string const & label);
  // Приводит метку к виду "start-end": " 08 - 16 " -> "8-16"
  static std::string Canonicalize(std::string const & label);
  static bool IsValidLabel(std::string const & label);

  void AddShift(std::string const & label, bool active = true);
  void RemoveShift(std::string const & label);
  void SetActive(std::string const & label, bool active);

  bool Contains(std::string const & label) const;
  bool IsActive(std::string const & label) const;
  ShiftHours const & GetHours(std::string const & label) const;

  std::map<std::string, bool> const & GetShifts() const;
  std::vector<ShiftDefinition> const & GetActiveShifts() const;

private:
  void Rebuild();

  std::map<std::string, bool> m_shifts;
  std::map<std::string, ShiftHours> m_hours;
  std::vector<ShiftDefinition> m_activeShifts;
};
