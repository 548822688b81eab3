#include "setBartenderConstraintsAgent.hpp"

#include "engine/constraintParser.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "kb/rotaKnowledgeBase.hpp"

#include <sc-memory/sc_memory.hpp>

SetBartenderConstraintsAgent::SetBartenderConstraintsAgent()
{
  m_logger = utils::ScLogger(
      utils::ScLogger::ScLogType::File, "logs/SetBartenderConstraintsAgent.log", utils::ScLogLevel::Debug);
}

ScAddr SetBartenderConstraintsAgent::GetActionClass() const
{
  return RotaKeynodes::action_set_bartender_constraints;
}

ScResult SetBartenderConstraintsAgent::DoProgram(ScAction & action)
{
  auto const & [bartender, textLink] = action.GetArguments<2>();

  RotaKnowledgeBase knowledgeBase(m_context, m_logger, m_config.defaultMaxShifts);
  if (!knowledgeBase.IsBartender(bartender))
  {
    m_logger.Error("SetBartenderConstraintsAgent: first argument is not a bartender");
    return action.FinishWithError();
  }
  if (!textLink.IsValid() || !m_context.GetElementType(textLink).IsLink())
  {
    m_logger.Error("SetBartenderConstraintsAgent: constraints text not provided");
    return action.FinishWithError();
  }

  std::string const name = knowledgeBase.GetMainIdtf(bartender);
  ConstraintParser const parser(m_logger, m_config.defaultMaxShifts);
  WorkerConstraints const constraints = parser.ParseConstraints(knowledgeBase.ResolveName(textLink));
  knowledgeBase.ReplaceConstraints(bartender, constraints);

  m_logger.Info(
      "SetBartenderConstraintsAgent: `",
      name,
      "` now has ",
      constraints.restrictedDays.size(),
      " days off, ",
      constraints.restrictedShifts.size(),
      " forbidden shifts, ",
      constraints.allowedShifts.size(),
      " allowed shifts, max ",
      constraints.maxShifts,
      " shifts");

  ScStructure result = m_context.GenerateStructure();
  result << bartender;
  action.SetResult(result);
  return action.FinishSuccessfully();
}
