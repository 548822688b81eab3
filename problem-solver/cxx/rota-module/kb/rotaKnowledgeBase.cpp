#include "rotaKnowledgeBase.hpp"

#include "engine/rotaExceptions.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "storage/rotaJsonStorage.hpp"

#include <sc-agents-common/utils/IteratorUtils.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <utility>

namespace
{
std::vector<std::pair<Weekday, ScAddr>> GetWeekdayNodes()
{
  return {
      {Weekday::Sunday, RotaKeynodes::sunday},
      {Weekday::Monday, RotaKeynodes::monday},
      {Weekday::Tuesday, RotaKeynodes::tuesday},
      {Weekday::Wednesday, RotaKeynodes::wednesday},
      {Weekday::Thursday, RotaKeynodes::thursday},
      {Weekday::Friday, RotaKeynodes::friday},
      {Weekday::Saturday, RotaKeynodes::saturday}};
}

std::optional<int> ParseInt(std::string const & text)
{
  int value = 0;
  auto const [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc() || end != text.data() + text.size())
    return std::nullopt;
  return value;
}
}  // namespace

RotaKnowledgeBase::RotaKnowledgeBase(ScAgentContext & context, utils::ScLogger & logger, int defaultMaxShifts)
  : m_context(context)
  , m_logger(logger)
  , m_defaultMaxShifts(defaultMaxShifts)
{
}

// ===== Вспомогательные методы =====

ScAddr RotaKnowledgeBase::GenerateRelation(ScAddr const & source, ScAddr const & target, ScAddr const & relation)
{
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, source, target);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
  return arc;
}

ScAddr RotaKnowledgeBase::GenerateTextLink(std::string const & text)
{
  ScAddr link = m_context.GenerateLink(ScType::ConstNodeLink);
  m_context.SetLinkContent(link, text);
  return link;
}

std::string RotaKnowledgeBase::ReadRelationLink(ScAddr const & node, ScAddr const & relation) const
{
  ScAddr const link = utils::IteratorUtils::getAnyByOutRelation(&m_context, node, relation);
  std::string content;
  if (link.IsValid())
    m_context.GetLinkContent(link, content);
  return content;
}

std::vector<ScAddr> RotaKnowledgeBase::GetRelationTargets(ScAddr const & node, ScAddr const & relation) const
{
  std::vector<ScAddr> targets;
  ScIterator5Ptr it = m_context.CreateIterator5(
      node, ScType::ConstCommonArc, ScType::Unknown, ScType::ConstPermPosArc, relation);
  while (it->Next())
    targets.push_back(it->Get(2));
  return targets;
}

void RotaKnowledgeBase::EraseRelations(ScAddr const & node, ScAddr const & relation)
{
  std::vector<ScAddr> arcs;
  std::vector<ScAddr> links;
  ScIterator5Ptr it = m_context.CreateIterator5(
      node, ScType::ConstCommonArc, ScType::Unknown, ScType::ConstPermPosArc, relation);
  while (it->Next())
  {
    arcs.push_back(it->Get(1));
    if (m_context.GetElementType(it->Get(2)).IsLink())
      links.push_back(it->Get(2));
  }

  for (auto const & arc : arcs)
    m_context.EraseElement(arc);
  for (auto const & link : links)
    m_context.EraseElement(link);
}

void RotaKnowledgeBase::SetRelationLink(ScAddr const & node, ScAddr const & relation, std::string const & text)
{
  ScAddr const link = utils::IteratorUtils::getAnyByOutRelation(&m_context, node, relation);
  if (link.IsValid())
    m_context.SetLinkContent(link, text);
  else
    GenerateRelation(node, GenerateTextLink(text), relation);
}

std::string RotaKnowledgeBase::GetMainIdtf(ScAddr const & node) const
{
  return ReadRelationLink(node, ScKeynodes::nrel_main_idtf);
}

std::string RotaKnowledgeBase::ResolveName(ScAddr const & addr) const
{
  if (!addr.IsValid())
    return "";

  if (m_context.GetElementType(addr).IsLink())
  {
    std::string content;
    m_context.GetLinkContent(addr, content);
    return content;
  }

  std::string const weekday = GetWeekdayName(addr);
  if (!weekday.empty())
    return weekday;
  return GetMainIdtf(addr);
}

ScAddr RotaKnowledgeBase::GetWeekdayNode(std::string const & weekdayName) const
{
  auto const weekday = DateUtils::ParseWeekday(weekdayName);
  if (!weekday)
    return ScAddr();

  for (auto const & [day, node] : GetWeekdayNodes())
  {
    if (day == *weekday)
      return node;
  }
  return ScAddr();
}

std::string RotaKnowledgeBase::GetWeekdayName(ScAddr const & weekdayNode) const
{
  for (auto const & [day, node] : GetWeekdayNodes())
  {
    if (node == weekdayNode)
      return DateUtils::GetWeekdayName(day);
  }
  return "";
}

// ===== Бармены и смены =====

bool RotaKnowledgeBase::IsBartender(ScAddr const & node) const
{
  return node.IsValid() && m_context.CheckConnector(RotaKeynodes::concept_bartender, node, ScType::ConstPermPosArc);
}

ScAddr RotaKnowledgeBase::FindBartender(std::string const & name) const
{
  ScIterator3Ptr it = m_context.CreateIterator3(RotaKeynodes::concept_bartender, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    if (GetMainIdtf(it->Get(2)) == name)
      return it->Get(2);
  }
  return ScAddr();
}

std::vector<std::string> RotaKnowledgeBase::ReadBartenderNames() const
{
  std::vector<std::string> names;
  ScIterator3Ptr it = m_context.CreateIterator3(RotaKeynodes::concept_bartender, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    std::string const name = GetMainIdtf(it->Get(2));
    if (!name.empty())
      names.push_back(name);
  }
  return names;
}

ScAddr RotaKnowledgeBase::FindShift(std::string const & label) const
{
  ScIterator3Ptr it = m_context.CreateIterator3(RotaKeynodes::concept_shift, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    if (GetMainIdtf(it->Get(2)) == label)
      return it->Get(2);
  }
  return ScAddr();
}

// Смена, которой ещё нет в базе, создаётся неактивной
ScAddr RotaKnowledgeBase::FindOrCreateShift(std::string const & label)
{
  ScAddr shift = FindShift(label);
  if (shift.IsValid())
    return shift;

  shift = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_shift, shift);
  GenerateRelation(shift, GenerateTextLink(label), ScKeynodes::nrel_main_idtf);
  m_logger.Info("RotaKnowledgeBase: created inactive shift `", label, "`");
  return shift;
}

void RotaKnowledgeBase::WriteConstraints(ScAddr const & bartender, WorkerConstraints const & constraints)
{
  for (auto const & shift : constraints.allowedShifts)
    GenerateRelation(bartender, FindOrCreateShift(shift), RotaKeynodes::nrel_allowed_shift);

  for (auto const & shift : constraints.restrictedShifts)
    GenerateRelation(bartender, FindOrCreateShift(shift), RotaKeynodes::nrel_restricted_shift);

  for (auto const & day : constraints.restrictedDays)
  {
    ScAddr const weekday = GetWeekdayNode(day);
    if (!weekday.IsValid())
    {
      m_logger.Warning("RotaKnowledgeBase: `", day, "` is not a weekday, restriction not stored");
      continue;
    }
    GenerateRelation(bartender, weekday, RotaKeynodes::nrel_restricted_day);
  }

  GenerateRelation(bartender, GenerateTextLink(std::to_string(constraints.maxShifts)), RotaKeynodes::nrel_max_shifts);
}

ScAddr RotaKnowledgeBase::CreateBartender(std::string const & name, WorkerConstraints const & constraints)
{
  ScAddr bartender = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_bartender, bartender);
  GenerateRelation(bartender, GenerateTextLink(name), ScKeynodes::nrel_main_idtf);
  WriteConstraints(bartender, constraints);
  return bartender;
}

void RotaKnowledgeBase::ReplaceConstraints(ScAddr const & bartender, WorkerConstraints const & constraints)
{
  EraseRelations(bartender, RotaKeynodes::nrel_allowed_shift);
  EraseRelations(bartender, RotaKeynodes::nrel_restricted_shift);
  EraseRelations(bartender, RotaKeynodes::nrel_restricted_day);
  EraseRelations(bartender, RotaKeynodes::nrel_max_shifts);
  WriteConstraints(bartender, constraints);
}

WorkerConstraints RotaKnowledgeBase::ReadConstraints(ScAddr const & bartender, std::string const & name) const
{
  WorkerConstraints constraints;
  constraints.maxShifts = m_defaultMaxShifts;
  for (auto const & shift : GetRelationTargets(bartender, RotaKeynodes::nrel_allowed_shift))
    constraints.allowedShifts.insert(GetMainIdtf(shift));
  for (auto const & shift : GetRelationTargets(bartender, RotaKeynodes::nrel_restricted_shift))
    constraints.restrictedShifts.insert(GetMainIdtf(shift));
  for (auto const & day : GetRelationTargets(bartender, RotaKeynodes::nrel_restricted_day))
    constraints.restrictedDays.insert(ResolveName(day));

  std::string const maxShifts = ReadRelationLink(bartender, RotaKeynodes::nrel_max_shifts);
  if (!maxShifts.empty())
  {
    auto const value = ParseInt(maxShifts);
    if (value && *value > 0)
      constraints.maxShifts = *value;
    else
      m_logger.Warning(
          "RotaKnowledgeBase: invalid max shifts `", maxShifts, "` of `", name, "`, using ", m_defaultMaxShifts);
  }
  return constraints;
}

// ===== Чтение состояния ротации =====

ConstraintStore RotaKnowledgeBase::ReadConstraintStore() const
{
  ConstraintStore store(m_defaultMaxShifts);
  ScIterator3Ptr it = m_context.CreateIterator3(RotaKeynodes::concept_bartender, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    ScAddr const bartender = it->Get(2);
    std::string const name = GetMainIdtf(bartender);
    try
    {
      store.AddWorker(name, ReadConstraints(bartender, name));
    }
    catch (RotaValidationException const & exception)
    {
      m_logger.Warning("RotaKnowledgeBase: skipping bartender: ", exception.what());
    }
  }
  return store;
}

ShiftCatalog RotaKnowledgeBase::ReadShiftCatalog() const
{
  ShiftCatalog catalog;
  ScIterator3Ptr it = m_context.CreateIterator3(RotaKeynodes::concept_shift, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    ScAddr const shift = it->Get(2);
    bool const active = m_context.CheckConnector(RotaKeynodes::concept_active_shift, shift, ScType::ConstPermPosArc);
    try
    {
      catalog.AddShift(GetMainIdtf(shift), active);
    }
    catch (RotaValidationException const & exception)
    {
      m_logger.Warning("RotaKnowledgeBase: skipping shift: ", exception.what());
    }
  }
  return catalog;
}

ScheduleArchive RotaKnowledgeBase::ReadArchive() const
{
  ScheduleArchive archive;
  ScIterator3Ptr it =
      m_context.CreateIterator3(RotaKeynodes::concept_published_week, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    ScAddr const week = it->Get(2);
    std::string const weekKey = ReadRelationLink(week, RotaKeynodes::nrel_week_start);
    if (archive.count(weekKey) > 0)
    {
      m_logger.Warning("RotaKnowledgeBase: week ", weekKey, " is published twice, keeping the first snapshot");
      continue;
    }

    nlohmann::json const snapshot =
        nlohmann::json::parse(ReadRelationLink(week, RotaKeynodes::nrel_schedule_snapshot), nullptr, false);
    if (snapshot.is_discarded())
    {
      m_logger.Warning("RotaKnowledgeBase: published week ", weekKey, " has an unreadable snapshot, skipping");
      continue;
    }

    try
    {
      archive[weekKey] = RotaJsonStorage::WeekScheduleFromJson(snapshot);
    }
    catch (RotaPersistenceException const & exception)
    {
      m_logger.Warning("RotaKnowledgeBase: skipping published week ", weekKey, ": ", exception.what());
    }
  }
  return archive;
}

// ===== Недели =====

bool RotaKnowledgeBase::IsWeekSchedule(ScAddr const & node) const
{
  return node.IsValid()
         && m_context.CheckConnector(RotaKeynodes::concept_week_schedule, node, ScType::ConstPermPosArc);
}

void RotaKnowledgeBase::WriteWeekContent(
    ScAddr const & scheduleNode,
    WeekSchedule const & schedule,
    ShiftLoad const & load,
    UnassignedReasons const & reasons,
    ScStructure & result)
{
  result << scheduleNode;

  for (auto const & day : schedule.GetDays())
  {
    ScAddr const weekday = GetWeekdayNode(day.weekday);
    for (auto const & [shiftLabel, worker] : day.slots)
    {
      ScAddr assignment = m_context.GenerateNode(ScType::ConstNode);
      m_context.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_shift_assignment, assignment);
      m_context.GenerateConnector(ScType::ConstPermPosArc, scheduleNode, assignment);

      if (weekday.IsValid())
        GenerateRelation(assignment, weekday, RotaKeynodes::nrel_shift_day);
      GenerateRelation(assignment, FindOrCreateShift(shiftLabel), RotaKeynodes::nrel_shift_type);

      if (worker == UNASSIGNED)
      {
        auto const reason = reasons.find(MakeSlotKey(day.weekday, shiftLabel));
        if (reason != reasons.cend())
          GenerateRelation(assignment, GenerateTextLink(reason->second), RotaKeynodes::nrel_unassigned_reason);
      }
      else
      {
        ScAddr const bartender = FindBartender(worker);
        if (bartender.IsValid())
          GenerateRelation(assignment, bartender, RotaKeynodes::nrel_assigned_bartender);
        else
          m_logger.Warning("RotaKnowledgeBase: bartender `", worker, "` is not in the knowledge base");
      }

      result << assignment;
    }
  }

  for (auto const & [worker, count] : load)
  {
    ScAddr const bartender = FindBartender(worker);
    if (!bartender.IsValid())
      continue;

    ScAddr countLink = GenerateTextLink(std::to_string(count));
    m_context.GenerateConnector(ScType::ConstPermPosArc, scheduleNode, countLink);
    ScAddr arcWorkload = GenerateRelation(bartender, countLink, RotaKeynodes::nrel_workload);
    result << countLink << arcWorkload;
  }
}

void RotaKnowledgeBase::EraseWeekContent(ScAddr const & scheduleNode)
{
  std::vector<ScAddr> elements;
  ScIterator3Ptr it = m_context.CreateIterator3(scheduleNode, ScType::ConstPermPosArc, ScType::Unknown);
  while (it->Next())
  {
    ScAddr const element = it->Get(2);
    if (m_context.GetElementType(element).IsLink()
        || m_context.CheckConnector(RotaKeynodes::concept_shift_assignment, element, ScType::ConstPermPosArc))
      elements.push_back(element);
  }

  for (auto const & element : elements)
  {
    // Ссылки причин висят на узлах назначений
    for (auto const & reason : GetRelationTargets(element, RotaKeynodes::nrel_unassigned_reason))
      m_context.EraseElement(reason);
    m_context.EraseElement(element);
  }
}

ScAddr RotaKnowledgeBase::CreateWeekSchedule(GenerationResult const & week, ScStructure & result)
{
  ScAddr scheduleNode = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_week_schedule, scheduleNode);

  GenerateRelation(scheduleNode, GenerateTextLink(DateUtils::ToIsoString(week.weekStart)), RotaKeynodes::nrel_week_start);
  GenerateRelation(
      scheduleNode,
      GenerateTextLink(RotaJsonStorage::Dump(RotaJsonStorage::WeekScheduleToJson(week.schedule))),
      RotaKeynodes::nrel_schedule_snapshot);
  GenerateRelation(
      scheduleNode,
      GenerateTextLink(RotaJsonStorage::Dump(RotaJsonStorage::ReasonsToJson(week.reasons))),
      RotaKeynodes::nrel_unassigned_reason);

  WriteWeekContent(scheduleNode, week.schedule, week.load, week.reasons, result);
  return scheduleNode;
}

StoredWeek RotaKnowledgeBase::ReadWeekSchedule(ScAddr const & scheduleNode) const
{
  if (!IsWeekSchedule(scheduleNode))
    SC_THROW_EXCEPTION(RotaValidationException, "Argument is not a week schedule");

  StoredWeek week;
  week.node = scheduleNode;

  std::string const weekKey = ReadRelationLink(scheduleNode, RotaKeynodes::nrel_week_start);
  auto const weekStart = DateUtils::ParseIsoDate(weekKey);
  if (!weekStart)
    SC_THROW_EXCEPTION(RotaValidationException, "Week schedule has invalid start date `" << weekKey << "`");
  week.weekStart = *weekStart;

  nlohmann::json const snapshot =
      nlohmann::json::parse(ReadRelationLink(scheduleNode, RotaKeynodes::nrel_schedule_snapshot), nullptr, false);
  if (snapshot.is_discarded())
    SC_THROW_EXCEPTION(RotaPersistenceException, "Week " << weekKey << " has an unreadable snapshot");
  week.schedule = RotaJsonStorage::WeekScheduleFromJson(snapshot);

  nlohmann::json const reasons =
      nlohmann::json::parse(ReadRelationLink(scheduleNode, RotaKeynodes::nrel_unassigned_reason), nullptr, false);
  if (!reasons.is_discarded())
    week.reasons = RotaJsonStorage::ReasonsFromJson(reasons);

  for (auto const & name : ReadBartenderNames())
    week.load[name] = 0;
  for (auto const & [worker, count] : week.schedule.CountLoad())
    week.load[worker] = count;

  week.published = m_context.CheckConnector(RotaKeynodes::concept_published_week, scheduleNode, ScType::ConstPermPosArc);
  return week;
}

void RotaKnowledgeBase::RewriteWeekSchedule(StoredWeek const & week, ScStructure & result)
{
  SetRelationLink(
      week.node,
      RotaKeynodes::nrel_schedule_snapshot,
      RotaJsonStorage::Dump(RotaJsonStorage::WeekScheduleToJson(week.schedule)));
  SetRelationLink(
      week.node,
      RotaKeynodes::nrel_unassigned_reason,
      RotaJsonStorage::Dump(RotaJsonStorage::ReasonsToJson(week.reasons)));

  EraseWeekContent(week.node);
  WriteWeekContent(week.node, week.schedule, week.load, week.reasons, result);
}

ScAddr RotaKnowledgeBase::FindPublishedWeek(CalendarDate const & weekStart) const
{
  std::string const weekKey = DateUtils::ToIsoString(weekStart);
  ScIterator3Ptr it =
      m_context.CreateIterator3(RotaKeynodes::concept_published_week, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    if (ReadRelationLink(it->Get(2), RotaKeynodes::nrel_week_start) == weekKey)
      return it->Get(2);
  }
  return ScAddr();
}

void RotaKnowledgeBase::MarkPublished(ScAddr const & scheduleNode)
{
  m_context.GenerateConnector(ScType::ConstPermPosArc, RotaKeynodes::concept_published_week, scheduleNode);
}

void RotaKnowledgeBase::AddPublishViolator(
    ScAddr const & scheduleNode,
    std::string const & name,
    ScStructure & result)
{
  ScAddr violator = FindBartender(name);
  if (!violator.IsValid())
    violator = GenerateTextLink(name);

  ScAddr const arc = GenerateRelation(scheduleNode, violator, RotaKeynodes::nrel_publish_violator);
  result << violator << arc;
}
