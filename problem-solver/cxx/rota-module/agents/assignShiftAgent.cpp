#include "assignShiftAgent.hpp"

#include "engine/manualEditor.hpp"
#include "engine/rotaExceptions.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "kb/rotaKnowledgeBase.hpp"

#include <sc-memory/sc_memory.hpp>

AssignShiftAgent::AssignShiftAgent()
{
  m_logger =
      utils::ScLogger(utils::ScLogger::ScLogType::File, "logs/AssignShiftAgent.log", utils::ScLogLevel::Debug);
}

ScAddr AssignShiftAgent::GetActionClass() const
{
  return RotaKeynodes::action_assign_shift;
}

// Бармен передаётся узлом бармена или ссылкой с именем; ссылка "Unassigned" освобождает слот
ScResult AssignShiftAgent::DoProgram(ScAction & action)
{
  auto const & [scheduleNode, bartenderAddr, dayAddr, shiftAddr] = action.GetArguments<4>();

  RotaKnowledgeBase knowledgeBase(m_context, m_logger);
  ScStructure result = m_context.GenerateStructure();

  try
  {
    if (bartenderAddr.IsValid() && !m_context.GetElementType(bartenderAddr).IsLink()
        && !knowledgeBase.IsBartender(bartenderAddr))
      SC_THROW_EXCEPTION(RotaValidationException, "Second argument is not a bartender");

    StoredWeek week = knowledgeBase.ReadWeekSchedule(scheduleNode);
    if (week.published || knowledgeBase.FindPublishedWeek(week.weekStart).IsValid())
      SC_THROW_EXCEPTION(
          RotaValidationException, "Week " << DateUtils::ToIsoString(week.weekStart) << " is published");

    std::string const worker = knowledgeBase.ResolveName(bartenderAddr);
    std::string const day = knowledgeBase.ResolveName(dayAddr);
    std::string const shift = knowledgeBase.ResolveName(shiftAddr);

    ManualEditor editor(week.schedule, week.load, &week.reasons);
    editor.OverrideAssign(worker, day, shift);
    knowledgeBase.RewriteWeekSchedule(week, result);

    m_logger.Info("AssignShiftAgent: `", worker, "` assigned to ", day, " ", shift);
  }
  catch (utils::ScException const & exception)
  {
    m_logger.Error("AssignShiftAgent: ", exception.what());
    return action.FinishWithError();
  }

  action.SetResult(result);
  return action.FinishSuccessfully();
}
