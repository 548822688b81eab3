#include "swapShiftsAgent.hpp"

#include "engine/manualEditor.hpp"
#include "engine/rotaExceptions.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "kb/rotaKnowledgeBase.hpp"

#include <sc-memory/sc_memory.hpp>

SwapShiftsAgent::SwapShiftsAgent()
{
  m_logger =
      utils::ScLogger(utils::ScLogger::ScLogType::File, "logs/SwapShiftsAgent.log", utils::ScLogLevel::Debug);
}

ScAddr SwapShiftsAgent::GetActionClass() const
{
  return RotaKeynodes::action_swap_shifts;
}

ScResult SwapShiftsAgent::DoProgram(ScAction & action)
{
  auto const & [scheduleNode, firstDayAddr, secondDayAddr, firstShiftAddr, secondShiftAddr] =
      action.GetArguments<5>();

  RotaKnowledgeBase knowledgeBase(m_context, m_logger);
  ScStructure result = m_context.GenerateStructure();

  try
  {
    StoredWeek week = knowledgeBase.ReadWeekSchedule(scheduleNode);
    if (week.published || knowledgeBase.FindPublishedWeek(week.weekStart).IsValid())
      SC_THROW_EXCEPTION(
          RotaValidationException, "Week " << DateUtils::ToIsoString(week.weekStart) << " is published");

    std::string const firstDay = knowledgeBase.ResolveName(firstDayAddr);
    std::string const secondDay = knowledgeBase.ResolveName(secondDayAddr);
    std::string const firstShift = knowledgeBase.ResolveName(firstShiftAddr);
    std::string const secondShift = knowledgeBase.ResolveName(secondShiftAddr);

    ManualEditor editor(week.schedule, week.load, &week.reasons);
    editor.Swap(firstDay, firstShift, secondDay, secondShift);
    knowledgeBase.RewriteWeekSchedule(week, result);

    m_logger.Info("SwapShiftsAgent: swapped ", firstDay, " ", firstShift, " with ", secondDay, " ", secondShift);
  }
  catch (utils::ScException const & exception)
  {
    m_logger.Error("SwapShiftsAgent: ", exception.what());
    return action.FinishWithError();
  }

  action.SetResult(result);
  return action.FinishSuccessfully();
}
