/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "engine/calendarDate.hpp"
#include "engine/rotaConfig.hpp"
#include "engine/scheduleGenerator.hpp"

#include <sc-memory/sc_agent.hpp>

#include <optional>

class BuildWeekScheduleAgent : public ScActionInitiatedAgent
{
public:
  BuildWeekScheduleAgent();

  ScAddr GetActionClass() const override;

  ScResult DoProgram(ScAction & action) override;

private:
  // Дата, неделю которой надо построить; без аргумента берётся сегодняшняя
  std::optional<CalendarDate> GetReferenceDate(ScAction & action);

  void LogWeeklySchedule(GenerationResult const & week);

  RotaConfig m_config;
};
