#pragma once

#include "engine/calendarDate.hpp"
#include "engine/constraintStore.hpp"
#include "engine/scheduleGenerator.hpp"
#include "engine/shiftCatalog.hpp"
#include "engine/weekSchedule.hpp"

#include <sc-memory/sc_agent_context.hpp>
#include <sc-memory/sc_structure.hpp>
#include <sc-memory/utils/sc_logger.hpp>

#include <optional>
#include <string>
#include <vector>

// Неделя, прочитанная из узла расписания
struct StoredWeek
{
  ScAddr node;
  CalendarDate weekStart;
  WeekSchedule schedule;
  ShiftLoad load;
  UnassignedReasons reasons;
  bool published = false;
};

// Отображение записей ротации на sc-память.
// Узел недели хранит дату воскресенья, JSON-снимок расписания и узлы concept_shift_assignment.
class RotaKnowledgeBase
{
public:
  RotaKnowledgeBase(ScAgentContext & context, utils::ScLogger & logger, int defaultMaxShifts = DEFAULT_MAX_SHIFTS);

  // ===== Чтение состояния ротации =====

  ConstraintStore ReadConstraintStore() const;
  ShiftCatalog ReadShiftCatalog() const;
  ScheduleArchive ReadArchive() const;
  std::vector<std::string> ReadBartenderNames() const;

  // ===== Бармены и смены =====

  ScAddr FindBartender(std::string const & name) const;
  ScAddr CreateBartender(std::string const & name, WorkerConstraints const & constraints);
  void ReplaceConstraints(ScAddr const & bartender, WorkerConstraints const & constraints);
  bool IsBartender(ScAddr const & node) const;

  ScAddr FindShift(std::string const & label) const;
  ScAddr FindOrCreateShift(std::string const & label);

  // Текст аргумента: содержимое ссылки, название дня недели или основной идентификатор
  std::string ResolveName(ScAddr const & addr) const;
  std::string GetMainIdtf(ScAddr const & node) const;

  // ===== Недели =====

  ScAddr CreateWeekSchedule(GenerationResult const & week, ScStructure & result);
  StoredWeek ReadWeekSchedule(ScAddr const & scheduleNode) const;
  void RewriteWeekSchedule(StoredWeek const & week, ScStructure & result);
  ScAddr FindPublishedWeek(CalendarDate const & weekStart) const;
  void MarkPublished(ScAddr const & scheduleNode);
  // Связывает неделю с барменом, из-за которого публикация отклонена
  void AddPublishViolator(ScAddr const & scheduleNode, std::string const & name, ScStructure & result);
  bool IsWeekSchedule(ScAddr const & node) const;

  ScAddr GetWeekdayNode(std::string const & weekdayName) const;
  std::string GetWeekdayName(ScAddr const & weekdayNode) const;

private:
  ScAddr GenerateRelation(ScAddr const & source, ScAddr const & target, ScAddr const & relation);
  ScAddr GenerateTextLink(std::string const & text);
  std::string ReadRelationLink(ScAddr const & node, ScAddr const & relation) const;
  std::vector<ScAddr> GetRelationTargets(ScAddr const & node, ScAddr const & relation) const;
  void EraseRelations(ScAddr const & node, ScAddr const & relation);
  void SetRelationLink(ScAddr const & node, ScAddr const & relation, std::string const & text);

  WorkerConstraints ReadConstraints(ScAddr const & bartender, std::string const & name) const;
  void WriteConstraints(ScAddr const & bartender, WorkerConstraints const & constraints);
  void WriteWeekContent(
      ScAddr const & scheduleNode,
      WeekSchedule const & schedule,
      ShiftLoad const & load,
      UnassignedReasons const & reasons,
      ScStructure & result);
  void EraseWeekContent(ScAddr const & scheduleNode);

  ScAgentContext & m_context;
  utils::ScLogger & m_logger;
  int m_defaultMaxShifts;
};
