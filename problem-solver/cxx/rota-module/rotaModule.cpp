#include "rotaModule.hpp"

#include "agents/assignShiftAgent.hpp"
#include "agents/buildWeekScheduleAgent.hpp"
#include "agents/importBartendersAgent.hpp"
#include "agents/publishWeekScheduleAgent.hpp"
#include "agents/setBartenderConstraintsAgent.hpp"
#include "agents/swapShiftsAgent.hpp"

SC_MODULE_REGISTER(RotaModule)
    ->Agent<ImportBartendersAgent>()
    ->Agent<SetBartenderConstraintsAgent>()
    ->Agent<BuildWeekScheduleAgent>()
    ->Agent<SwapShiftsAgent>()
    ->Agent<AssignShiftAgent>()
    ->Agent<PublishWeekScheduleAgent>();
