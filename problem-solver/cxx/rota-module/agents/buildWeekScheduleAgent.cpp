#include "buildWeekScheduleAgent.hpp"

#include "engine/randomSource.hpp"
#include "engine/weekCalendar.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "kb/rotaKnowledgeBase.hpp"
#include "utils/stringFormatter.hpp"

#include <sc-memory/sc_memory_headers.hpp>

BuildWeekScheduleAgent::BuildWeekScheduleAgent()
{
  m_logger = utils::ScLogger(
      utils::ScLogger::ScLogType::File, "logs/BuildWeekScheduleAgent.log", utils::ScLogLevel::Debug);
}

ScAddr BuildWeekScheduleAgent::GetActionClass() const
{
  return RotaKeynodes::action_build_week_schedule;
}

std::optional<CalendarDate> BuildWeekScheduleAgent::GetReferenceDate(ScAction & action)
{
  auto const & [dateLink] = action.GetArguments<1>();
  if (!dateLink.IsValid())
  {
    m_logger.Info("BuildWeekScheduleAgent: no date provided, building the current week");
    return DateUtils::SystemToday();
  }

  std::string content;
  m_context.GetLinkContent(dateLink, content);
  return DateUtils::ParseIsoDate(StringFormatter::Trim(content));
}

void BuildWeekScheduleAgent::LogWeeklySchedule(GenerationResult const & week)
{
  m_logger.Info("BuildWeekScheduleAgent: === Weekly schedule per bartender ===");
  for (auto const & [worker, count] : week.load)
  {
    std::string schedule = worker + ": ";
    for (auto const & day : week.schedule.GetDays())
    {
      bool hasShift = false;
      for (auto const & [shift, occupant] : day.slots)
        hasShift = hasShift || occupant == worker;
      schedule += hasShift ? "W " : "- ";
    }
    schedule += "| Total: " + std::to_string(count) + " shifts";
    m_logger.Info(schedule);
  }

  for (auto const & [slot, reason] : week.reasons)
    m_logger.Info("BuildWeekScheduleAgent: ", slot, " unassigned. ", reason);
}

ScResult BuildWeekScheduleAgent::DoProgram(ScAction & action)
{
  auto const referenceDate = GetReferenceDate(action);
  if (!referenceDate)
  {
    m_logger.Error("BuildWeekScheduleAgent: reference date must be written as YYYY-MM-DD");
    return action.FinishWithError();
  }

  CalendarDate const weekStart = WeekCalendar::WeekStart(*referenceDate);
  std::string const weekKey = DateUtils::ToIsoString(weekStart);
  m_logger.Info("BuildWeekScheduleAgent: building week of ", weekKey);

  RotaKnowledgeBase knowledgeBase(m_context, m_logger, m_config.defaultMaxShifts);
  ScStructure result = m_context.GenerateStructure();

  // Опубликованная неделя не пересчитывается
  ScAddr const publishedWeek = knowledgeBase.FindPublishedWeek(weekStart);
  if (publishedWeek.IsValid())
  {
    m_logger.Info("BuildWeekScheduleAgent: week ", weekKey, " is already published");
    result << publishedWeek;
    action.SetResult(result);
    return action.FinishSuccessfully();
  }

  try
  {
    ConstraintStore const constraints = knowledgeBase.ReadConstraintStore();
    ShiftCatalog const catalog = knowledgeBase.ReadShiftCatalog();
    ScheduleArchive const archive = knowledgeBase.ReadArchive();

    if (catalog.GetActiveShifts().empty())
      m_logger.Warning("BuildWeekScheduleAgent: no active shifts, the week will be empty");

    MersenneRandomSource random;
    ScheduleGenerator const generator(m_config, random, m_logger);
    GenerationResult const week = generator.Generate(weekStart, catalog, constraints, archive);

    knowledgeBase.CreateWeekSchedule(week, result);
    LogWeeklySchedule(week);

    m_logger.Info(
        "BuildWeekScheduleAgent: filled ",
        week.schedule.CountSlots() - week.schedule.CountUnassigned(),
        " of ",
        week.schedule.CountSlots(),
        " slots");
  }
  catch (utils::ScException const & exception)
  {
    m_logger.Error("BuildWeekScheduleAgent: ", exception.what());
    return action.FinishWithError();
  }

  action.SetResult(result);
  return action.FinishSuccessfully();
}
