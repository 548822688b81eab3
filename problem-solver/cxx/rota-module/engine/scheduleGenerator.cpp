#include "scheduleGenerator.hpp"
#include "streakTracker.hpp"
#include "weekCalendar.hpp"

namespace
{
int const HOURS_PER_DAY = 24;
}  // namespace

ScheduleGenerator::ScheduleGenerator(RotaConfig const & config, RandomSource & random, utils::ScLogger & logger)
  : m_config(config)
  , m_random(random)
  , m_logger(logger)
{
}

ScheduleGenerator::Exclusion ScheduleGenerator::CheckEligibility(
    WorkerConstraints const & constraints,
    std::string const & dayName,
    int dayIndex,
    ShiftDefinition const & shift,
    int currentLoad,
    LastShift const * lastShift) const
{
  if (constraints.restrictedDays.count(dayName) > 0)
    return Exclusion::RestrictedDay;

  if (constraints.restrictedShifts.count(shift.label) > 0)
    return Exclusion::RestrictedShift;

  if (!constraints.allowedShifts.empty() && constraints.allowedShifts.count(shift.label) == 0)
    return Exclusion::NotWhitelisted;

  if (currentLoad >= constraints.maxShifts)
    return Exclusion::MaxShifts;

  if (lastShift != nullptr)
  {
    int const restHours = (dayIndex - lastShift->dayIndex) * HOURS_PER_DAY + (shift.hours.start - lastShift->endHour);
    if (restHours < m_config.minRestHours)
      return Exclusion::RestGap;
  }

  return Exclusion::None;
}

// Субботний фильтр не должен оставлять слот пустым: если он отсеивает всех, он не применяется
std::vector<std::string> ScheduleGenerator::ApplySaturdayRule(
    std::vector<std::string> const & eligible,
    SaturdayStreakMap const & streaks) const
{
  std::vector<std::string> filtered;
  for (auto const & worker : eligible)
  {
    auto const it = streaks.find(worker);
    if (it == streaks.cend() || it->second < m_config.saturdayStreakLimit)
      filtered.push_back(worker);
  }

  if (filtered.empty())
  {
    if (!eligible.empty())
      m_logger.Debug("ScheduleGenerator: every candidate has a long Saturday streak, ignoring the streak filter");
    return eligible;
  }
  return filtered;
}

std::string ScheduleGenerator::DescribeUnassigned(size_t workerCount, std::map<Exclusion, int> const & exclusions)
{
  if (workerCount == 0)
    return "No eligible bartender: no bartenders are configured";

  std::string reason = "No eligible bartender:";
  auto const append = [&reason, &exclusions](Exclusion exclusion, std::string const & text) {
    auto const it = exclusions.find(exclusion);
    if (it != exclusions.cend() && it->second > 0)
      reason += " " + text + " " + std::to_string(it->second) + ";";
  };
  append(Exclusion::RestrictedDay, "day off for");
  append(Exclusion::RestrictedShift, "shift forbidden for");
  append(Exclusion::NotWhitelisted, "shift not allowed for");
  append(Exclusion::MaxShifts, "weekly limit reached by");
  append(Exclusion::RestGap, "rest time too short for");

  if (reason.back() == ';')
    reason.pop_back();
  return reason;
}

GenerationResult ScheduleGenerator::Generate(
    CalendarDate const & weekStart,
    ShiftCatalog const & catalog,
    ConstraintStore const & constraints,
    ScheduleArchive const & archive) const
{
  GenerationResult result;
  result.weekStart = weekStart;

  std::string const weekKey = DateUtils::ToIsoString(weekStart);
  auto const archived = archive.find(weekKey);
  if (archived != archive.cend())
  {
    m_logger.Info("ScheduleGenerator: week ", weekKey, " is published, reusing the archived schedule");
    result.schedule = archived->second;
    result.load = result.schedule.CountLoad();
    result.fromArchive = true;
    return result;
  }

  std::vector<std::string> const workers = constraints.GetWorkerNames();
  for (auto const & worker : workers)
    result.load[worker] = 0;

  StreakTracker const tracker(archive, m_logger);
  SaturdayStreakMap const priorStreaks = tracker.ComputeStreaks(workers, weekStart);

  std::map<std::string, LastShift> lastShifts;
  std::string const saturday = DateUtils::GetWeekdayName(Weekday::Saturday);

  for (auto const & [weekday, date] : WeekCalendar::DaysOf(weekStart))
  {
    int const dayIndex = DateUtils::GetWeekdayIndex(weekday);
    std::string const dayName = DateUtils::GetWeekdayName(weekday);
    ScheduleDay & day = result.schedule.AddDay(WeekSchedule::MakeDayLabel(weekday, date));

    // Порядок смен внутри дня случайный, чтобы первые смены не получали преимущества
    std::vector<ShiftDefinition> shifts = catalog.GetActiveShifts();
    m_random.Shuffle(shifts);

    for (auto const & shift : shifts)
    {
      std::vector<std::string> eligible;
      std::map<Exclusion, int> exclusions;
      for (auto const & worker : workers)
      {
        auto const last = lastShifts.find(worker);
        Exclusion const exclusion = CheckEligibility(
            constraints.GetConstraints(worker),
            dayName,
            dayIndex,
            shift,
            result.load[worker],
            last != lastShifts.cend() ? &last->second : nullptr);

        if (exclusion == Exclusion::None)
          eligible.push_back(worker);
        else
          ++exclusions[exclusion];
      }

      if (dayName == saturday)
        eligible = ApplySaturdayRule(eligible, priorStreaks);

      if (eligible.empty())
      {
        day.slots[shift.label] = UNASSIGNED;
        result.reasons[MakeSlotKey(dayName, shift.label)] = DescribeUnassigned(workers.size(), exclusions);
        m_logger.Debug("ScheduleGenerator: ", dayName, " ", shift.label, " left unassigned");
        continue;
      }

      std::string const & chosen = eligible[m_random.PickIndex(eligible.size())];
      day.slots[shift.label] = chosen;
      ++result.load[chosen];
      lastShifts[chosen] = {dayIndex, shift.hours.end};
      m_logger.Debug("ScheduleGenerator: ", dayName, " ", shift.label, " -> ", chosen);
    }
  }

  m_logger.Info(
      "ScheduleGenerator: week ",
      weekKey,
      " filled ",
      result.schedule.CountSlots() - result.schedule.CountUnassigned(),
      " of ",
      result.schedule.CountSlots(),
      " slots");

  return result;
}
