#include <gtest/gtest.h>

#include "engine/streakTracker.hpp"
#include "utils/TestUtils.hpp"

namespace
{

CalendarDate const WEEK_1{2026, 9, 27};
CalendarDate const WEEK_2{2026, 10, 4};
CalendarDate const WEEK_3{2026, 10, 11};
CalendarDate const WEEK_4{2026, 10, 18};
CalendarDate const WEEK_5{2026, 10, 25};

// Неделя, где в субботу работает saturdayWorker, остальные дни заняты "Other"
WeekSchedule WeekWithSaturday(CalendarDate const & weekStart, std::string const & saturdayWorker)
{
  return TestUtils::MakeWeek(
      weekStart, "16-1", {"Other", "Other", "Other", "Other", "Other", "Other", saturdayWorker});
}

class StreakTrackerTest : public testing::Test
{
protected:
  void Archive(CalendarDate const & weekStart, WeekSchedule const & week)
  {
    m_archive[DateUtils::ToIsoString(weekStart)] = week;
  }

  utils::ScLogger m_logger = TestUtils::MakeLogger();
  ScheduleArchive m_archive;
  StreakTracker m_tracker{m_archive, m_logger};
};

}  // namespace

// ====== ПОДСЧЁТ СЕРИЙ ======

TEST_F(StreakTrackerTest, EmptyArchive_AllZero)
{
  SaturdayStreakMap const streaks = m_tracker.ComputeStreaks({"A", "B"}, WEEK_4);
  EXPECT_EQ(streaks.at("A"), 0);
  EXPECT_EQ(streaks.at("B"), 0);
}

TEST_F(StreakTrackerTest, AbsentWorker_ZeroStreak)
{
  Archive(WEEK_1, WeekWithSaturday(WEEK_1, "A"));
  Archive(WEEK_2, WeekWithSaturday(WEEK_2, "A"));

  SaturdayStreakMap const streaks = m_tracker.ComputeStreaks({"A", "B"}, WEEK_4);
  EXPECT_EQ(streaks.at("A"), 2);
  EXPECT_EQ(streaks.at("B"), 0);
}

TEST_F(StreakTrackerTest, ConsecutiveSaturdays_Accumulate)
{
  Archive(WEEK_1, WeekWithSaturday(WEEK_1, "A"));
  Archive(WEEK_2, WeekWithSaturday(WEEK_2, "A"));
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));

  EXPECT_EQ(m_tracker.ComputeStreaks({"A"}, WEEK_4).at("A"), 3);
}

TEST_F(StreakTrackerTest, MissedSaturday_ResetsStreak)
{
  Archive(WEEK_1, WeekWithSaturday(WEEK_1, "A"));
  Archive(WEEK_2, WeekWithSaturday(WEEK_2, "B"));
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));

  SaturdayStreakMap const streaks = m_tracker.ComputeStreaks({"A", "B"}, WEEK_4);
  EXPECT_EQ(streaks.at("A"), 1);
  EXPECT_EQ(streaks.at("B"), 0);
}

TEST_F(StreakTrackerTest, WeekWithoutSaturday_ResetsEveryone)
{
  Archive(WEEK_1, WeekWithSaturday(WEEK_1, "A"));
  Archive(WEEK_2, WeekWithSaturday(WEEK_2, "A"));
  Archive(WEEK_3, TestUtils::MakeWeek(WEEK_3, "16-1", {"A", "A", "A", "A", "A", "A"}));

  EXPECT_EQ(m_tracker.ComputeStreaks({"A"}, WEEK_4).at("A"), 0);
}

TEST_F(StreakTrackerTest, UnassignedSaturday_NotCounted)
{
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, UNASSIGNED));

  SaturdayStreakMap const streaks = m_tracker.ComputeStreaks({"A"}, WEEK_4);
  EXPECT_EQ(streaks.count(UNASSIGNED), 0u);
  EXPECT_EQ(streaks.at("A"), 0);
}

TEST_F(StreakTrackerTest, InvalidArchiveKey_Skipped)
{
  Archive(WEEK_2, WeekWithSaturday(WEEK_2, "A"));
  m_archive["not a date"] = WeekWithSaturday(WEEK_3, "B");
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));

  SaturdayStreakMap const streaks = m_tracker.ComputeStreaks({"A"}, WEEK_4);
  EXPECT_EQ(streaks.at("A"), 2);
}

TEST_F(StreakTrackerTest, WeeksAfterViewedWeek_Ignored)
{
  Archive(WEEK_2, WeekWithSaturday(WEEK_2, "A"));
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));
  Archive(WEEK_5, WeekWithSaturday(WEEK_5, "B"));

  SaturdayStreakMap const streaks = m_tracker.ComputeStreaks({"A"}, WEEK_3);
  EXPECT_EQ(streaks.at("A"), 2);
}

TEST_F(StreakTrackerTest, ArchivedWorkers_TrackedWithoutConstraints)
{
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "Former"));

  SaturdayStreakMap const streaks = m_tracker.ComputeStreaks({"A"}, WEEK_4);
  EXPECT_EQ(streaks.at("Former"), 1);
  EXPECT_EQ(streaks.at("Other"), 0);
}

TEST_F(StreakTrackerTest, ExtraWeek_AppliedAfterArchive)
{
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));
  WeekSchedule const candidate = WeekWithSaturday(WEEK_4, "A");

  EXPECT_EQ(m_tracker.ComputeStreaks({"A"}, WEEK_4, &candidate).at("A"), 2);
}

// ====== ТЕКУЩАЯ НЕДЕЛЯ ======

TEST_F(StreakTrackerTest, IncludeCurrent_AppliesViewedWeek)
{
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));
  WeekSchedule const current = WeekWithSaturday(WEEK_4, "A");
  CalendarDate const today{2026, 10, 19};

  EXPECT_EQ(m_tracker.GetSaturdayStreaks({"A"}, WEEK_4, today, current, true).at("A"), 2);
  EXPECT_EQ(m_tracker.GetSaturdayStreaks({"A"}, WEEK_4, today, current, false).at("A"), 1);
}

TEST_F(StreakTrackerTest, IncludeCurrent_FutureWeekNotApplied)
{
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));
  WeekSchedule const current = WeekWithSaturday(WEEK_5, "A");
  CalendarDate const today{2026, 10, 19};

  EXPECT_EQ(m_tracker.GetSaturdayStreaks({"A"}, WEEK_5, today, current, true).at("A"), 1);
}

TEST_F(StreakTrackerTest, IncludeCurrent_PublishedWeekCountedOnce)
{
  Archive(WEEK_3, WeekWithSaturday(WEEK_3, "A"));
  Archive(WEEK_4, WeekWithSaturday(WEEK_4, "A"));
  WeekSchedule const current = m_archive.at(DateUtils::ToIsoString(WEEK_4));
  CalendarDate const today{2026, 10, 19};

  EXPECT_EQ(m_tracker.GetSaturdayStreaks({"A"}, WEEK_4, today, current, true).at("A"), 2);
}
