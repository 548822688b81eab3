#include "weekSchedule.hpp"
#include "rotaExceptions.hpp"

#include "utils/stringFormatter.hpp"

bool ScheduleDay::operator==(ScheduleDay const & other) const
{
  return label == other.label && weekday == other.weekday && slots == other.slots;
}

std::string WeekSchedule::MakeDayLabel(Weekday day, CalendarDate const & date)
{
  return DateUtils::GetWeekdayName(day) + " " + DateUtils::ToIsoString(date);
}

std::string WeekSchedule::WeekdayFromLabel(std::string const & label)
{
  std::string const trimmed = StringFormatter::Trim(label);
  std::string const firstWord = trimmed.substr(0, trimmed.find(' '));
  auto const weekday = DateUtils::ParseWeekday(firstWord);
  if (!weekday)
    return "";
  return DateUtils::GetWeekdayName(*weekday);
}

ScheduleDay & WeekSchedule::AddDay(std::string const & label)
{
  ScheduleDay day;
  day.label = label;
  day.weekday = WeekdayFromLabel(label);
  m_days.push_back(day);
  return m_days.back();
}

std::vector<ScheduleDay> const & WeekSchedule::GetDays() const
{
  return m_days;
}

std::optional<size_t> WeekSchedule::FindDayIndex(std::string const & day) const
{
  for (size_t i = 0; i < m_days.size(); ++i)
  {
    if (m_days[i].label == day)
      return i;
  }
  // Одно слово без даты трактуется как название дня недели
  std::string const weekday = WeekdayFromLabel(day);
  if (!weekday.empty() && StringFormatter::Trim(day).find(' ') == std::string::npos)
  {
    for (size_t i = 0; i < m_days.size(); ++i)
    {
      if (m_days[i].weekday == weekday)
        return i;
    }
  }
  return std::nullopt;
}

ScheduleDay const * WeekSchedule::FindDay(std::string const & day) const
{
  auto const index = FindDayIndex(day);
  return index ? &m_days[*index] : nullptr;
}

ScheduleDay * WeekSchedule::FindMutableDay(std::string const & day)
{
  auto const index = FindDayIndex(day);
  return index ? &m_days[*index] : nullptr;
}

bool WeekSchedule::HasSlot(std::string const & day, std::string const & shift) const
{
  ScheduleDay const * scheduleDay = FindDay(day);
  return scheduleDay != nullptr && scheduleDay->slots.count(shift) > 0;
}

std::string const & WeekSchedule::GetOccupant(std::string const & day, std::string const & shift) const
{
  ScheduleDay const * scheduleDay = FindDay(day);
  if (scheduleDay == nullptr)
    SC_THROW_EXCEPTION(RotaValidationException, "Day `" << day << "` is not part of the schedule");

  auto const it = scheduleDay->slots.find(shift);
  if (it == scheduleDay->slots.cend())
    SC_THROW_EXCEPTION(RotaValidationException, "Shift `" << shift << "` is not scheduled on " << day);

  return it->second;
}

void WeekSchedule::SetOccupant(std::string const & day, std::string const & shift, std::string const & worker)
{
  ScheduleDay * scheduleDay = FindMutableDay(day);
  if (scheduleDay == nullptr)
    SC_THROW_EXCEPTION(RotaValidationException, "Day `" << day << "` is not part of the schedule");

  scheduleDay->slots[shift] = worker;
}

size_t WeekSchedule::CountSlots() const
{
  size_t count = 0;
  for (auto const & day : m_days)
    count += day.slots.size();
  return count;
}

size_t WeekSchedule::CountUnassigned() const
{
  size_t count = 0;
  for (auto const & day : m_days)
  {
    for (auto const & [shift, worker] : day.slots)
    {
      if (worker == UNASSIGNED)
        ++count;
    }
  }
  return count;
}

ShiftLoad WeekSchedule::CountLoad() const
{
  ShiftLoad load;
  for (auto const & day : m_days)
  {
    for (auto const & [shift, worker] : day.slots)
    {
      if (worker != UNASSIGNED)
        ++load[worker];
    }
  }
  return load;
}

std::set<std::string> WeekSchedule::GetWorkers() const
{
  std::set<std::string> workers;
  for (auto const & day : m_days)
  {
    for (auto const & [shift, worker] : day.slots)
    {
      if (worker != UNASSIGNED)
        workers.insert(worker);
    }
  }
  return workers;
}

std::optional<std::set<std::string>> WeekSchedule::GetSaturdayWorkers() const
{
  std::string const saturday = DateUtils::GetWeekdayName(Weekday::Saturday);
  for (auto const & day : m_days)
  {
    if (day.weekday != saturday)
      continue;

    std::set<std::string> workers;
    for (auto const & [shift, worker] : day.slots)
    {
      if (worker != UNASSIGNED)
        workers.insert(worker);
    }
    return workers;
  }
  return std::nullopt;
}

bool WeekSchedule::IsEmpty() const
{
  return m_days.empty();
}

bool WeekSchedule::operator==(WeekSchedule const & other) const
{
  return m_days == other.m_days;
}

bool WeekSchedule::operator!=(WeekSchedule const & other) const
{
  return !(*this == other);
}
