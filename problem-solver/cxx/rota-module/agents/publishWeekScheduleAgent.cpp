#include "publishWeekScheduleAgent.hpp"

#include "engine/rotaExceptions.hpp"
#include "engine/scheduleStore.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "kb/rotaKnowledgeBase.hpp"

#include <sc-memory/sc_memory.hpp>

PublishWeekScheduleAgent::PublishWeekScheduleAgent()
{
  m_logger = utils::ScLogger(
      utils::ScLogger::ScLogType::File, "logs/PublishWeekScheduleAgent.log", utils::ScLogLevel::Debug);
}

ScAddr PublishWeekScheduleAgent::GetActionClass() const
{
  return RotaKeynodes::action_publish_week_schedule;
}

ScResult PublishWeekScheduleAgent::DoProgram(ScAction & action)
{
  auto const & [scheduleNode] = action.GetArguments<1>();

  RotaKnowledgeBase knowledgeBase(m_context, m_logger, m_config.defaultMaxShifts);
  ScStructure result = m_context.GenerateStructure();

  try
  {
    StoredWeek const week = knowledgeBase.ReadWeekSchedule(scheduleNode);
    if (week.published)
      SC_THROW_EXCEPTION(
          RotaValidationException, "Week " << DateUtils::ToIsoString(week.weekStart) << " is already published");

    // Архивом служит база знаний, файл не пишется
    RotaConfig storeConfig = m_config;
    storeConfig.archivePath.clear();
    ScheduleStore store(storeConfig, m_logger);
    store.SetArchive(knowledgeBase.ReadArchive());

    store.Publish(week.weekStart, week.schedule, knowledgeBase.ReadBartenderNames());
    knowledgeBase.MarkPublished(scheduleNode);
    result << scheduleNode;
  }
  catch (PublishBlockedException const & exception)
  {
    m_logger.Warning("PublishWeekScheduleAgent: ", exception.what());
    result << scheduleNode;
    for (auto const & violator : exception.GetViolators())
      knowledgeBase.AddPublishViolator(scheduleNode, violator, result);
    action.SetResult(result);
    return action.FinishUnsuccessfully();
  }
  catch (utils::ScException const & exception)
  {
    m_logger.Error("PublishWeekScheduleAgent: ", exception.what());
    return action.FinishWithError();
  }

  m_logger.Info("PublishWeekScheduleAgent: week published");
  action.SetResult(result);
  return action.FinishSuccessfully();
}
