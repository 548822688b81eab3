#include <sc-memory/test/sc_test.hpp>
#include <sc-memory/sc_memory.hpp>

#include "agents/swapShiftsAgent.hpp"
#include "kb/rotaKnowledgeBase.hpp"
#include "keynodes/rota-keynodes.hpp"
#include "utils/TestUtils.hpp"

using SwapShiftsAgentTest = ScMemoryTest;

namespace
{

CalendarDate const WEEK_START{2026, 10, 18};

struct TestBar
{
  ScAddr shift;
  ScAddr loiko;
  ScAddr shumilov;
  ScAddr schedule;
};

// Лойко: воскресенье, вторник, четверг; Шумилов: понедельник, среда, пятница; суббота пустая
TestBar CreateTestBar(ScAgentContext & ctx, bool published = false)
{
  TestBar bar;
  bar.shift = TestUtils::CreateShift(ctx, "16-1");
  bar.loiko = TestUtils::CreateBartender(ctx, "Лойко");
  bar.shumilov = TestUtils::CreateBartender(ctx, "Шумилов");
  bar.schedule = TestUtils::CreateStoredWeek(
      ctx, WEEK_START, "16-1", {"Лойко", "Шумилов", "Лойко", "Шумилов", "Лойко", "Шумилов", UNASSIGNED}, published);
  return bar;
}

ScAction CreateSwapAction(
    ScAgentContext & ctx,
    TestBar const & bar,
    ScAddr const & firstDay,
    ScAddr const & secondDay,
    ScAddr const & secondShift = ScAddr())
{
  return TestUtils::CreateAction(
      ctx,
      RotaKeynodes::action_swap_shifts,
      {bar.schedule, firstDay, secondDay, bar.shift, secondShift.IsValid() ? secondShift : bar.shift});
}

}  // namespace

TEST_F(SwapShiftsAgentTest, SwapShifts_Success)
{
  m_ctx->SubscribeAgent<SwapShiftsAgent>();
  TestBar const bar = CreateTestBar(*m_ctx);

  ScAction action = CreateSwapAction(*m_ctx, bar, RotaKeynodes::sunday, RotaKeynodes::monday);
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedSuccessfully());

  EXPECT_EQ(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::sunday, bar.shift), bar.shumilov);
  EXPECT_EQ(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::monday, bar.shift), bar.loiko);
  EXPECT_EQ(TestUtils::CountAssignments(*m_ctx, bar.schedule), 7);
  EXPECT_EQ(TestUtils::GetBartenderWorkload(*m_ctx, bar.schedule, bar.loiko), 3);
  EXPECT_EQ(TestUtils::GetBartenderWorkload(*m_ctx, bar.schedule, bar.shumilov), 3);

  m_ctx->UnsubscribeAgent<SwapShiftsAgent>();
}

TEST_F(SwapShiftsAgentTest, SwapShifts_WithEmptySlot)
{
  m_ctx->SubscribeAgent<SwapShiftsAgent>();
  TestBar const bar = CreateTestBar(*m_ctx);

  ScAction action = CreateSwapAction(*m_ctx, bar, RotaKeynodes::tuesday, RotaKeynodes::saturday);
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedSuccessfully());

  EXPECT_FALSE(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::tuesday, bar.shift).IsValid());
  EXPECT_EQ(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::saturday, bar.shift), bar.loiko);

  utils::ScLogger logger = TestUtils::MakeLogger();
  RotaKnowledgeBase knowledgeBase(*m_ctx, logger);
  StoredWeek const week = knowledgeBase.ReadWeekSchedule(bar.schedule);
  EXPECT_EQ(week.schedule.GetOccupant("Saturday", "16-1"), "Лойко");
  EXPECT_EQ(week.schedule.GetOccupant("Tuesday", "16-1"), UNASSIGNED);

  m_ctx->UnsubscribeAgent<SwapShiftsAgent>();
}

TEST_F(SwapShiftsAgentTest, SwapShifts_TwiceRestoresWeek)
{
  m_ctx->SubscribeAgent<SwapShiftsAgent>();
  TestBar const bar = CreateTestBar(*m_ctx);

  for (int i = 0; i < 2; ++i)
  {
    ScAction action = CreateSwapAction(*m_ctx, bar, RotaKeynodes::sunday, RotaKeynodes::friday);
    EXPECT_TRUE(action.InitiateAndWait(5000));
    EXPECT_TRUE(action.IsFinishedSuccessfully());
  }

  EXPECT_EQ(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::sunday, bar.shift), bar.loiko);
  EXPECT_EQ(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::friday, bar.shift), bar.shumilov);
  EXPECT_EQ(TestUtils::CountAssignments(*m_ctx, bar.schedule), 7);

  m_ctx->UnsubscribeAgent<SwapShiftsAgent>();
}

// ====== ОШИБКИ ======

TEST_F(SwapShiftsAgentTest, SwapShifts_UnknownShift)
{
  m_ctx->SubscribeAgent<SwapShiftsAgent>();
  TestBar const bar = CreateTestBar(*m_ctx);
  ScAddr morning = TestUtils::CreateShift(*m_ctx, "8-16");

  ScAction action = CreateSwapAction(*m_ctx, bar, RotaKeynodes::sunday, RotaKeynodes::monday, morning);
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedWithError());

  EXPECT_EQ(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::sunday, bar.shift), bar.loiko);

  m_ctx->UnsubscribeAgent<SwapShiftsAgent>();
}

TEST_F(SwapShiftsAgentTest, SwapShifts_PublishedWeek)
{
  m_ctx->SubscribeAgent<SwapShiftsAgent>();
  TestBar const bar = CreateTestBar(*m_ctx, true);

  ScAction action = CreateSwapAction(*m_ctx, bar, RotaKeynodes::sunday, RotaKeynodes::monday);
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedWithError());

  EXPECT_EQ(TestUtils::GetAssignedBartender(*m_ctx, bar.schedule, RotaKeynodes::sunday, bar.shift), bar.loiko);

  m_ctx->UnsubscribeAgent<SwapShiftsAgent>();
}

TEST_F(SwapShiftsAgentTest, SwapShifts_DraftOfPublishedWeek)
{
  m_ctx->SubscribeAgent<SwapShiftsAgent>();
  TestBar const bar = CreateTestBar(*m_ctx);
  TestUtils::CreateStoredWeek(*m_ctx, WEEK_START, "16-1", {"Лойко"}, true);

  ScAction action = CreateSwapAction(*m_ctx, bar, RotaKeynodes::sunday, RotaKeynodes::monday);
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedWithError());

  m_ctx->UnsubscribeAgent<SwapShiftsAgent>();
}

TEST_F(SwapShiftsAgentTest, SwapShifts_NotASchedule)
{
  m_ctx->SubscribeAgent<SwapShiftsAgent>();
  TestBar bar = CreateTestBar(*m_ctx);
  bar.schedule = m_ctx->GenerateNode(ScType::ConstNode);

  ScAction action = CreateSwapAction(*m_ctx, bar, RotaKeynodes::sunday, RotaKeynodes::monday);
  EXPECT_TRUE(action.InitiateAndWait(5000));
  EXPECT_TRUE(action.IsFinishedWithError());

  m_ctx->UnsubscribeAgent<SwapShiftsAgent>();
}
