#include "importBartendersAgent.hpp"

#include "keynodes/rota-keynodes.hpp"
#include "kb/rotaKnowledgeBase.hpp"
#include "storage/rotaJsonStorage.hpp"
#include "utils/stringFormatter.hpp"

#include <sc-memory/sc_memory.hpp>

#include <nlohmann/json.hpp>

ImportBartendersAgent::ImportBartendersAgent()
{
  m_logger = utils::ScLogger(
      utils::ScLogger::ScLogType::File, "logs/ImportBartendersAgent.log", utils::ScLogLevel::Debug);
}

ScAddr ImportBartendersAgent::GetActionClass() const
{
  return RotaKeynodes::action_import_bartenders;
}

std::string ImportBartendersAgent::GetFileContent(ScAction & action)
{
  ScIterator5Ptr it5 = m_context.CreateIterator5(
      action, ScType::ConstCommonArc, ScType::ConstNodeLink, ScType::ConstPermPosArc, RotaKeynodes::nrel_file_content);
  if (!it5->Next())
  {
    m_logger.Error("ImportBartendersAgent: bartenders document not provided");
    return "";
  }

  std::string content;
  m_context.GetLinkContent(it5->Get(2), content);
  return content;
}

ScResult ImportBartendersAgent::DoProgram(ScAction & action)
{
  std::string const content = StringFormatter::Trim(GetFileContent(action));
  if (content.empty())
  {
    m_logger.Error("ImportBartendersAgent: bartenders document is empty");
    return action.FinishWithError();
  }

  nlohmann::json const document = nlohmann::json::parse(content, nullptr, false);
  if (document.is_discarded() || !document.is_object())
  {
    m_logger.Error("ImportBartendersAgent: bartenders document is not a JSON object");
    return action.FinishWithError();
  }

  RotaKnowledgeBase knowledgeBase(m_context, m_logger, m_config.defaultMaxShifts);
  ConstraintStore const store = RotaJsonStorage::ConstraintsFromJson(document, m_logger, m_config.defaultMaxShifts);

  ScStructure result = m_context.GenerateStructure();
  int importedCount = 0;
  for (auto const & [name, constraints] : store.GetWorkers())
  {
    if (knowledgeBase.FindBartender(name).IsValid())
    {
      m_logger.Warning("ImportBartendersAgent: bartender `", name, "` already exists, skipping");
      continue;
    }

    result << knowledgeBase.CreateBartender(name, constraints);
    ++importedCount;
  }

  action.SetResult(result);
  m_logger.Info("ImportBartendersAgent: imported ", importedCount, " bartenders");
  return action.FinishSuccessfully();
}
