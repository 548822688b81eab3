#pragma once

#include <sc-memory/sc_addr.hpp>
#include <sc-memory/sc_keynodes.hpp>

class RotaKeynodes : public ScKeynodes
{
public:
  static inline ScKeynode const action_import_bartenders{"action_import_bartenders", ScType::ConstNodeClass};
  static inline ScKeynode const action_set_bartender_constraints{
    "action_set_bartender_constraints", ScType::ConstNodeClass};
  static inline ScKeynode const action_build_week_schedule{"action_build_week_schedule", ScType::ConstNodeClass};
  static inline ScKeynode const action_swap_shifts{"action_swap_shifts", ScType::ConstNodeClass};
  static inline ScKeynode const action_assign_shift{"action_assign_shift", ScType::ConstNodeClass};
  static inline ScKeynode const action_publish_week_schedule{
    "action_publish_week_schedule", ScType::ConstNodeClass};

  // Staff and shifts
  static inline ScKeynode const concept_bartender{"concept_bartender", ScType::ConstNodeClass};
  static inline ScKeynode const concept_shift{"concept_shift", ScType::ConstNodeClass};
  static inline ScKeynode const concept_active_shift{"concept_active_shift", ScType::ConstNodeClass};

  // Constraints
  static inline ScKeynode const nrel_allowed_shift{"nrel_allowed_shift", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_restricted_day{"nrel_restricted_day", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_restricted_shift{"nrel_restricted_shift", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_max_shifts{"nrel_max_shifts", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_file_content{"nrel_file_content", ScType::ConstNodeNonRole};

  // Weekdays
  static inline ScKeynode const concept_weekday{"concept_weekday", ScType::ConstNodeClass};
  static inline ScKeynode const sunday{"sunday", ScType::ConstNode};
  static inline ScKeynode const monday{"monday", ScType::ConstNode};
  static inline ScKeynode const tuesday{"tuesday", ScType::ConstNode};
  static inline ScKeynode const wednesday{"wednesday", ScType::ConstNode};
  static inline ScKeynode const thursday{"thursday", ScType::ConstNode};
  static inline ScKeynode const friday{"friday", ScType::ConstNode};
  static inline ScKeynode const saturday{"saturday", ScType::ConstNode};

  // Schedule structure
  static inline ScKeynode const concept_week_schedule{"concept_week_schedule", ScType::ConstNodeClass};
  static inline ScKeynode const concept_published_week{"concept_published_week", ScType::ConstNodeClass};
  static inline ScKeynode const concept_shift_assignment{"concept_shift_assignment", ScType::ConstNodeClass};
  static inline ScKeynode const nrel_week_start{"nrel_week_start", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_schedule_snapshot{"nrel_schedule_snapshot", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_assigned_bartender{"nrel_assigned_bartender", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_shift_day{"nrel_shift_day", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_shift_type{"nrel_shift_type", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_unassigned_reason{"nrel_unassigned_reason", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_workload{"nrel_workload", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_publish_violator{"nrel_publish_violator", ScType::ConstNodeNonRole};
};
