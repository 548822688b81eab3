#include <sc-memory/test/sc_test.hpp>
#include <sc-memory/sc_memory.hpp>

#include "agents/setBartenderConstraintsAgent.hpp"
#include "kb/rotaKnowledgeBase.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "utils/TestUtils.hpp"

using SetBartenderConstraintsAgentTest = ScMemoryTest;

namespace
{

WorkerConstraints ReadConstraints(ScAgentContext & ctx, std::string const & name)
{
  utils::ScLogger logger = TestUtils::MakeLogger();
  RotaKnowledgeBase knowledgeBase(ctx, logger);
  return knowledgeBase.ReadConstraintStore().GetConstraints(name);
}

}  // namespace

TEST_F(SetBartenderConstraintsAgentTest, SetConstraints_Success)
{
  m_ctx->SubscribeAgent<SetBartenderConstraintsAgent>();

  ScAddr bartender = TestUtils::CreateBartender(*m_ctx, "Шумилов");
  ScAddr text = TestUtils::CreateTextLink(
      *m_ctx, "Doesn't work on Monday\nCannot work 16-1\nUp to 3 shifts a week");

  ScAction action =
      TestUtils::CreateAction(*m_ctx, RotaKeynodes::action_set_bartender_constraints, {bartender, text});
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedSuccessfully());
  EXPECT_TRUE(m_ctx->CheckConnector(action.GetResult(), bartender, ScType::ConstPermPosArc));

  WorkerConstraints const constraints = ReadConstraints(*m_ctx, "Шумилов");
  EXPECT_EQ(constraints.restrictedDays, std::set<std::string>{"Monday"});
  EXPECT_EQ(constraints.restrictedShifts, std::set<std::string>{"16-1"});
  EXPECT_TRUE(constraints.allowedShifts.empty());
  EXPECT_EQ(constraints.maxShifts, 3);

  m_ctx->UnsubscribeAgent<SetBartenderConstraintsAgent>();
}

TEST_F(SetBartenderConstraintsAgentTest, SetConstraints_ReplacesPrevious)
{
  m_ctx->SubscribeAgent<SetBartenderConstraintsAgent>();

  ScAddr bartender = TestUtils::CreateBartender(*m_ctx, "Шумилов", 2);

  ScAction first = TestUtils::CreateAction(
      *m_ctx,
      RotaKeynodes::action_set_bartender_constraints,
      {bartender, TestUtils::CreateTextLink(*m_ctx, "doesn't work Friday\ncannot work 8-16")});
  EXPECT_TRUE(first.InitiateAndWait(5000));
  EXPECT_TRUE(first.IsFinishedSuccessfully());

  ScAction second = TestUtils::CreateAction(
      *m_ctx,
      RotaKeynodes::action_set_bartender_constraints,
      {bartender, TestUtils::CreateTextLink(*m_ctx, "can only work 16-1 or 20-4")});
  EXPECT_TRUE(second.InitiateAndWait(5000));
  EXPECT_TRUE(second.IsFinishedSuccessfully());

  WorkerConstraints const constraints = ReadConstraints(*m_ctx, "Шумилов");
  EXPECT_TRUE(constraints.restrictedDays.empty());
  EXPECT_TRUE(constraints.restrictedShifts.empty());
  EXPECT_EQ(constraints.allowedShifts, (std::set<std::string>{"16-1", "20-4"}));
  EXPECT_EQ(constraints.maxShifts, DEFAULT_MAX_SHIFTS);
  EXPECT_EQ(TestUtils::GetRelationText(*m_ctx, bartender, RotaKeynodes::nrel_max_shifts), "5");

  m_ctx->UnsubscribeAgent<SetBartenderConstraintsAgent>();
}

TEST_F(SetBartenderConstraintsAgentTest, SetConstraints_EmptyTextClearsConstraints)
{
  m_ctx->SubscribeAgent<SetBartenderConstraintsAgent>();

  ScAddr bartender = TestUtils::CreateBartender(*m_ctx, "Лойко", 2);
  TestUtils::AddRelation(*m_ctx, bartender, RotaKeynodes::sunday, RotaKeynodes::nrel_restricted_day);

  ScAction action = TestUtils::CreateAction(
      *m_ctx, RotaKeynodes::action_set_bartender_constraints, {bartender, TestUtils::CreateTextLink(*m_ctx, "")});
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedSuccessfully());

  EXPECT_EQ(ReadConstraints(*m_ctx, "Лойко"), WorkerConstraints());

  m_ctx->UnsubscribeAgent<SetBartenderConstraintsAgent>();
}

// ====== ОШИБКИ ======

TEST_F(SetBartenderConstraintsAgentTest, SetConstraints_NotBartender)
{
  m_ctx->SubscribeAgent<SetBartenderConstraintsAgent>();

  ScAddr stranger = m_ctx->GenerateNode(ScType::ConstNode);
  ScAction action = TestUtils::CreateAction(
      *m_ctx,
      RotaKeynodes::action_set_bartender_constraints,
      {stranger, TestUtils::CreateTextLink(*m_ctx, "up to 2 shifts")});
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedWithError());

  m_ctx->UnsubscribeAgent<SetBartenderConstraintsAgent>();
}

TEST_F(SetBartenderConstraintsAgentTest, SetConstraints_NoText)
{
  m_ctx->SubscribeAgent<SetBartenderConstraintsAgent>();

  ScAddr bartender = TestUtils::CreateBartender(*m_ctx, "Лойко", 4);
  ScAction action = TestUtils::CreateAction(*m_ctx, RotaKeynodes::action_set_bartender_constraints, {bartender});
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedWithError());

  EXPECT_EQ(TestUtils::GetRelationText(*m_ctx, bartender, RotaKeynodes::nrel_max_shifts), "4");

  m_ctx->UnsubscribeAgent<SetBartenderConstraintsAgent>();
}
