#include "TestUtils.hpp"

#include "kb/rotaKnowledgeBase.hpp"
#include "keynodes/rota-keynodes.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace TestUtils
{

utils::ScLogger MakeLogger()
{
  return utils::ScLogger(utils::ScLogger::ScLogType::Console, "", utils::ScLogLevel::Warning);
}

Clock FixedClock(CalendarDate const & today)
{
  return [today]() {
    return today;
  };
}

size_t FirstChoiceRandomSource::PickIndex(size_t)
{
  return 0;
}

size_t LastChoiceRandomSource::PickIndex(size_t count)
{
  return count - 1;
}

WeekSchedule MakeWeek(
    CalendarDate const & weekStart,
    std::string const & shift,
    std::vector<std::string> const & workers)
{
  WeekSchedule week;
  for (size_t i = 0; i < workers.size(); ++i)
  {
    auto const weekday = static_cast<Weekday>(i);
    ScheduleDay & day = week.AddDay(WeekSchedule::MakeDayLabel(weekday, DateUtils::AddDays(weekStart, i)));
    day.slots[shift] = workers[i];
  }
  return week;
}

std::string MakeTempPath(std::string const & fileName)
{
  std::filesystem::path const path = std::filesystem::temp_directory_path() / fileName;
  std::filesystem::remove(path);
  return path.string();
}

void WriteFile(std::string const & path, std::string const & content)
{
  std::ofstream file(path, std::ios::trunc);
  file << content;
}

std::string ReadFile(std::string const & path)
{
  std::ifstream file(path);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

ScAddr CreateTextLink(ScAgentContext & ctx, std::string const & text)
{
  ScAddr link = ctx.GenerateLink(ScType::ConstNodeLink);
  ctx.SetLinkContent(link, text);
  return link;
}

void AddRelation(ScAgentContext & ctx, ScAddr const & source, ScAddr const & target, ScAddr const & relation)
{
  ScAddr arc = ctx.GenerateConnector(ScType::ConstCommonArc, source, target);
  ctx.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
}

ScAddr CreateShift(ScAgentContext & ctx, std::string const & label, bool active)
{
  ScAddr shift = ctx.GenerateNode(ScType::ConstNode);
  ctx.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_shift, shift);
  if (active)
    ctx.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_active_shift, shift);
  AddRelation(ctx, shift, CreateTextLink(ctx, label), ScKeynodes::nrel_main_idtf);
  return shift;
}

ScAddr CreateBartender(ScAgentContext & ctx, std::string const & name, int maxShifts)
{
  ScAddr bartender = ctx.GenerateNode(ScType::ConstNode);
  ctx.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_bartender, bartender);
  AddRelation(ctx, bartender, CreateTextLink(ctx, name), ScKeynodes::nrel_main_idtf);
  AddRelation(ctx, bartender, CreateTextLink(ctx, std::to_string(maxShifts)), RotaKeynodes::nrel_max_shifts);
  return bartender;
}

ScAddr FindBartenderByName(ScAgentContext & ctx, std::string const & targetName)
{
  ScIterator3Ptr it = ctx.CreateIterator3(RotaKeynodes::concept_bartender, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    if (GetRelationText(ctx, it->Get(2), ScKeynodes::nrel_main_idtf) == targetName)
      return it->Get(2);
  }
  return ScAddr();
}

ScAction CreateAction(ScAgentContext & ctx, ScAddr const & actionClass, std::vector<ScAddr> const & arguments)
{
  std::vector<ScAddr> const roles = {
      ScKeynodes::rrel_1, ScKeynodes::rrel_2, ScKeynodes::rrel_3, ScKeynodes::rrel_4, ScKeynodes::rrel_5};

  ScAddr action = ctx.GenerateNode(ScType::ConstNode);
  ctx.GenerateConnector(ScType::ConstPermPosArc, actionClass, action);
  for (size_t i = 0; i < arguments.size() && i < roles.size(); ++i)
  {
    ScAddr arc = ctx.GenerateConnector(ScType::ConstPermPosArc, action, arguments[i]);
    ctx.GenerateConnector(ScType::ConstPermPosArc, roles[i], arc);
  }
  return ctx.ConvertToAction(action);
}

ScAddr CreateStoredWeek(
    ScAgentContext & ctx,
    CalendarDate const & weekStart,
    std::string const & shift,
    std::vector<std::string> const & workers,
    bool published)
{
  utils::ScLogger logger = MakeLogger();
  RotaKnowledgeBase knowledgeBase(ctx, logger);

  GenerationResult week;
  week.weekStart = weekStart;
  week.schedule = MakeWeek(weekStart, shift, workers);
  week.load = week.schedule.CountLoad();

  ScStructure structure = ctx.GenerateStructure();
  ScAddr const scheduleNode = knowledgeBase.CreateWeekSchedule(week, structure);
  if (published)
    knowledgeBase.MarkPublished(scheduleNode);
  return scheduleNode;
}

ScAddr FindWeekSchedule(ScAgentContext & ctx, ScStructure const & result)
{
  ScIterator3Ptr it = ctx.CreateIterator3(result, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    if (ctx.CheckConnector(RotaKeynodes::concept_week_schedule, it->Get(2), ScType::ConstPermPosArc))
      return it->Get(2);
  }
  return ScAddr();
}

std::string GetRelationText(ScAgentContext & ctx, ScAddr const & node, ScAddr const & relation)
{
  ScIterator5Ptr it = ctx.CreateIterator5(
      node, ScType::ConstCommonArc, ScType::ConstNodeLink, ScType::ConstPermPosArc, relation);
  std::string content;
  if (it->Next())
    ctx.GetLinkContent(it->Get(2), content);
  return content;
}

int CountAssignments(ScAgentContext & ctx, ScAddr const & schedule)
{
  int count = 0;
  ScIterator3Ptr it = ctx.CreateIterator3(schedule, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    if (ctx.CheckConnector(RotaKeynodes::concept_shift_assignment, it->Get(2), ScType::ConstPermPosArc))
      count++;
  }
  return count;
}

int GetBartenderWorkload(ScAgentContext & ctx, ScAddr const & schedule, ScAddr const & bartender)
{
  ScIterator5Ptr it = ctx.CreateIterator5(
      bartender, ScType::ConstCommonArc, ScType::ConstNodeLink, ScType::ConstPermPosArc, RotaKeynodes::nrel_workload);
  while (it->Next())
  {
    if (!ctx.CheckConnector(schedule, it->Get(2), ScType::ConstPermPosArc))
      continue;

    std::string content;
    ctx.GetLinkContent(it->Get(2), content);
    return std::stoi(content);
  }
  return -1;
}

ScAddr GetAssignedBartender(
    ScAgentContext & ctx,
    ScAddr const & schedule,
    ScAddr const & weekday,
    ScAddr const & shift)
{
  ScIterator3Ptr it = ctx.CreateIterator3(schedule, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    ScAddr const assignment = it->Get(2);
    if (!ctx.CheckConnector(RotaKeynodes::concept_shift_assignment, assignment, ScType::ConstPermPosArc))
      continue;

    ScIterator5Ptr itDay = ctx.CreateIterator5(
        assignment, ScType::ConstCommonArc, weekday, ScType::ConstPermPosArc, RotaKeynodes::nrel_shift_day);
    ScIterator5Ptr itShift = ctx.CreateIterator5(
        assignment, ScType::ConstCommonArc, shift, ScType::ConstPermPosArc, RotaKeynodes::nrel_shift_type);
    if (!itDay->Next() || !itShift->Next())
      continue;

    ScIterator5Ptr itBartender = ctx.CreateIterator5(
        assignment, ScType::ConstCommonArc, ScType::ConstNode, ScType::ConstPermPosArc,
        RotaKeynodes::nrel_assigned_bartender);
    if (itBartender->Next())
      return itBartender->Get(2);
    return ScAddr();
  }
  return ScAddr();
}

}  // namespace TestUtils
