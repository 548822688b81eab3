#include "shiftCatalog.hpp"
#include "rotaExceptions.hpp"

#include "utils/stringFormatter.hpp"

#include <algorithm>
#include <cctype>

namespace
{
int const HOURS_PER_DAY = 24;

bool IsNumber(std::string const & str)
{
  return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}
}  // namespace

ShiftHours ShiftCatalog::Parse(std::string const & label)
{
  std::string const trimmed = StringFormatter::Trim(label);
  if (std::count(trimmed.begin(), trimmed.end(), '-') != 1)
    SC_THROW_EXCEPTION(ShiftFormatException, "Shift label `" << label << "` must look like `start-end`");

  size_t const separator = trimmed.find('-');
  std::string const startStr = StringFormatter::Trim(trimmed.substr(0, separator));
  std::string const endStr = StringFormatter::Trim(trimmed.substr(separator + 1));

  if (!IsNumber(startStr) || !IsNumber(endStr) || startStr.size() > 2 || endStr.size() > 2)
    SC_THROW_EXCEPTION(ShiftFormatException, "Shift label `" << label << "` must consist of two integer hours");

  ShiftHours hours;
  hours.start = std::stoi(startStr);
  hours.end = std::stoi(endStr);

  // Смена начинается в 0..23 и заканчивается в 0..24
  if (hours.start >= HOURS_PER_DAY || hours.end > HOURS_PER_DAY)
    SC_THROW_EXCEPTION(ShiftFormatException, "Shift label `" << label << "` has an hour outside 0..24");

  if (hours.end < hours.start)
    hours.end += HOURS_PER_DAY;
  if (hours.end <= hours.start)
    SC_THROW_EXCEPTION(ShiftFormatException, "Shift label `" << label << "` has zero length");

  return hours;
}

std::string ShiftCatalog::Canonicalize(std::string const & label)
{
  ShiftHours const hours = Parse(label);
  int const end = hours.end > HOURS_PER_DAY ? hours.end - HOURS_PER_DAY : hours.end;
  return std::to_string(hours.start) + "-" + std::to_string(end);
}

bool ShiftCatalog::IsValidLabel(std::string const & label)
{
  try
  {
    Parse(label);
    return true;
  }
  catch (ShiftFormatException const &)
  {
    return false;
  }
}

void ShiftCatalog::AddShift(std::string const & label, bool active)
{
  std::string const canonical = Canonicalize(label);
  if (m_shifts.count(canonical) > 0)
    SC_THROW_EXCEPTION(RotaValidationException, "Shift `" << canonical << "` already exists");

  m_shifts[canonical] = active;
  Rebuild();
}

void ShiftCatalog::RemoveShift(std::string const & label)
{
  if (m_shifts.erase(label) == 0)
    SC_THROW_EXCEPTION(RotaValidationException, "Shift `" << label << "` does not exist");

  Rebuild();
}

void ShiftCatalog::SetActive(std::string const & label, bool active)
{
  auto const it = m_shifts.find(label);
  if (it == m_shifts.end())
    SC_THROW_EXCEPTION(RotaValidationException, "Shift `" << label << "` does not exist");

  it->second = active;
  Rebuild();
}

bool ShiftCatalog::Contains(std::string const & label) const
{
  return m_shifts.count(label) > 0;
}

bool ShiftCatalog::IsActive(std::string const & label) const
{
  auto const it = m_shifts.find(label);
  return it != m_shifts.cend() && it->second;
}

ShiftHours const & ShiftCatalog::GetHours(std::string const & label) const
{
  auto const it = m_hours.find(label);
  if (it == m_hours.cend())
    SC_THROW_EXCEPTION(RotaValidationException, "Shift `" << label << "` does not exist");
  return it->second;
}

std::map<std::string, bool> const & ShiftCatalog::GetShifts() const
{
  return m_shifts;
}

std::vector<ShiftDefinition> const & ShiftCatalog::GetActiveShifts() const
{
  return m_activeShifts;
}

// Часы пересчитываются при каждом изменении набора смен
void ShiftCatalog::Rebuild()
{
  m_hours.clear();
  m_activeShifts.clear();

  for (auto const & [label, active] : m_shifts)
  {
    ShiftHours const hours = Parse(label);
    m_hours[label] = hours;
    if (active)
      m_activeShifts.push_back({label, active, hours});
  }

  std::sort(m_activeShifts.begin(), m_activeShifts.end(), [](ShiftDefinition const & a, ShiftDefinition const & b) {
    return a.hours.start < b.hours.start || (a.hours.start == b.hours.start && a.label < b.label);
  });
}
