#include "rotaJsonStorage.hpp"

#include "engine/rotaExceptions.hpp"

#include <algorithm>
#include <fstream>

namespace
{
std::string const FIELD_ALLOWED_SHIFTS = "allowedShifts";
std::string const FIELD_RESTRICTED_DAYS = "restrictedDays";
std::string const FIELD_RESTRICTED_SHIFTS = "restrictedShifts";
std::string const FIELD_MAX_SHIFTS = "maxShifts";

std::set<std::string> ReadStringSet(
    nlohmann::json const & entry,
    std::string const & field,
    std::string const & owner,
    utils::ScLogger & logger)
{
  std::set<std::string> values;
  if (!entry.contains(field))
    return values;

  nlohmann::json const & list = entry.at(field);
  if (!list.is_array())
  {
    logger.Warning("RotaJsonStorage: `", field, "` of `", owner, "` is not a list, ignoring it");
    return values;
  }

  for (auto const & value : list)
  {
    if (value.is_string())
      values.insert(value.get<std::string>());
    else
      logger.Warning("RotaJsonStorage: non-string value in `", field, "` of `", owner, "` ignored");
  }
  return values;
}

void ReadInt(nlohmann::json const & document, std::string const & field, int & target, utils::ScLogger & logger)
{
  if (!document.contains(field))
    return;
  if (document.at(field).is_number_integer())
    target = document.at(field).get<int>();
  else
    logger.Warning("RotaJsonStorage: config field `", field, "` is not an integer, keeping ", target);
}

void ReadString(
    nlohmann::json const & document,
    std::string const & field,
    std::string & target,
    utils::ScLogger & logger)
{
  if (!document.contains(field))
    return;
  if (document.at(field).is_string())
    target = document.at(field).get<std::string>();
  else
    logger.Warning("RotaJsonStorage: config field `", field, "` is not a string, ignoring it");
}
}  // namespace

nlohmann::json RotaJsonStorage::LoadDocument(std::string const & path, utils::ScLogger & logger)
{
  nlohmann::json const empty = nlohmann::json::object();
  if (path.empty())
    return empty;

  std::ifstream file(path);
  if (!file.is_open())
  {
    logger.Warning("RotaJsonStorage: cannot open `", path, "`, starting with empty data");
    return empty;
  }

  nlohmann::json document = nlohmann::json::parse(file, nullptr, false);
  if (document.is_discarded())
  {
    logger.Warning("RotaJsonStorage: `", path, "` is not valid JSON, starting with empty data");
    return empty;
  }
  if (!document.is_object())
  {
    logger.Warning("RotaJsonStorage: `", path, "` does not hold a JSON object, starting with empty data");
    return empty;
  }

  return document;
}

void RotaJsonStorage::SaveDocument(std::string const & path, nlohmann::json const & document)
{
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open())
    SC_THROW_EXCEPTION(RotaPersistenceException, "Cannot open `" << path << "` for writing");

  file << Dump(document, 2) << std::endl;
  if (!file.good())
    SC_THROW_EXCEPTION(RotaPersistenceException, "Failed to write `" << path << "`");
}

std::string RotaJsonStorage::Dump(nlohmann::json const & document, int indent)
{
  return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json RotaJsonStorage::ConstraintsToJson(ConstraintStore const & store)
{
  nlohmann::json document = nlohmann::json::object();
  for (auto const & [name, constraints] : store.GetWorkers())
  {
    document[name] = {
        {FIELD_ALLOWED_SHIFTS, constraints.allowedShifts},
        {FIELD_RESTRICTED_DAYS, constraints.restrictedDays},
        {FIELD_RESTRICTED_SHIFTS, constraints.restrictedShifts},
        {FIELD_MAX_SHIFTS, constraints.maxShifts}};
  }
  return document;
}

WorkerConstraints RotaJsonStorage::ConstraintsFromEntry(
    std::string const & name,
    nlohmann::json const & entry,
    int defaultMaxShifts,
    utils::ScLogger & logger)
{
  WorkerConstraints constraints;
  constraints.maxShifts = defaultMaxShifts;
  constraints.allowedShifts = ReadStringSet(entry, FIELD_ALLOWED_SHIFTS, name, logger);
  constraints.restrictedDays = ReadStringSet(entry, FIELD_RESTRICTED_DAYS, name, logger);
  constraints.restrictedShifts = ReadStringSet(entry, FIELD_RESTRICTED_SHIFTS, name, logger);

  if (entry.contains(FIELD_MAX_SHIFTS))
  {
    nlohmann::json const & maxShifts = entry.at(FIELD_MAX_SHIFTS);
    if (maxShifts.is_number_integer() && maxShifts.get<int>() > 0)
      constraints.maxShifts = maxShifts.get<int>();
    else
      logger.Warning("RotaJsonStorage: invalid maxShifts for `", name, "`, using ", defaultMaxShifts);
  }

  return constraints;
}

ConstraintStore RotaJsonStorage::ConstraintsFromJson(
    nlohmann::json const & document,
    utils::ScLogger & logger,
    int defaultMaxShifts)
{
  ConstraintStore store(defaultMaxShifts);
  if (!document.is_object())
  {
    logger.Warning("RotaJsonStorage: constraints document is not an object, ignoring it");
    return store;
  }

  for (auto const & [name, entry] : document.items())
  {
    if (!entry.is_object())
    {
      logger.Warning("RotaJsonStorage: constraints of `", name, "` are not an object, skipping");
      continue;
    }

    try
    {
      store.AddWorker(name, ConstraintsFromEntry(name, entry, defaultMaxShifts, logger));
    }
    catch (RotaValidationException const & exception)
    {
      logger.Warning("RotaJsonStorage: skipping bartender `", name, "`: ", exception.what());
    }
  }
  return store;
}

nlohmann::json RotaJsonStorage::ShiftCatalogToJson(ShiftCatalog const & catalog)
{
  nlohmann::json document = nlohmann::json::object();
  for (auto const & [label, active] : catalog.GetShifts())
    document[label] = active;
  return document;
}

ShiftCatalog RotaJsonStorage::ShiftCatalogFromJson(nlohmann::json const & document, utils::ScLogger & logger)
{
  ShiftCatalog catalog;
  if (!document.is_object())
  {
    logger.Warning("RotaJsonStorage: shift document is not an object, ignoring it");
    return catalog;
  }

  for (auto const & [label, active] : document.items())
  {
    if (!active.is_boolean())
    {
      logger.Warning("RotaJsonStorage: activity of shift `", label, "` is not a boolean, skipping");
      continue;
    }

    try
    {
      catalog.AddShift(label, active.get<bool>());
    }
    catch (RotaValidationException const & exception)
    {
      logger.Warning("RotaJsonStorage: rejected shift `", label, "`: ", exception.what());
    }
  }
  return catalog;
}

nlohmann::json RotaJsonStorage::WeekScheduleToJson(WeekSchedule const & schedule)
{
  nlohmann::json document = nlohmann::json::object();
  for (auto const & day : schedule.GetDays())
  {
    nlohmann::json slots = nlohmann::json::object();
    for (auto const & [shift, worker] : day.slots)
      slots[shift] = worker;
    document[day.label] = slots;
  }
  return document;
}

// Дни упорядочиваются с воскресенья по субботу; строки без дня недели идут последними
WeekSchedule RotaJsonStorage::WeekScheduleFromJson(nlohmann::json const & document)
{
  if (!document.is_object())
    SC_THROW_EXCEPTION(RotaPersistenceException, "Week schedule must be a JSON object");

  std::vector<std::pair<int, std::string>> labels;
  for (auto const & [label, slots] : document.items())
  {
    if (!slots.is_object())
      SC_THROW_EXCEPTION(RotaPersistenceException, "Day `" << label << "` must map shifts to bartenders");

    std::string const weekday = WeekSchedule::WeekdayFromLabel(label);
    auto const parsed = DateUtils::ParseWeekday(weekday);
    labels.emplace_back(parsed ? DateUtils::GetWeekdayIndex(*parsed) : 7, label);
  }
  std::stable_sort(labels.begin(), labels.end(), [](auto const & a, auto const & b) {
    return a.first < b.first;
  });

  WeekSchedule schedule;
  for (auto const & [index, label] : labels)
  {
    ScheduleDay & day = schedule.AddDay(label);
    for (auto const & [shift, worker] : document.at(label).items())
    {
      if (!worker.is_string())
        SC_THROW_EXCEPTION(RotaPersistenceException, "Slot `" << label << " " << shift << "` must hold a name");
      day.slots[shift] = worker.get<std::string>();
    }
  }
  return schedule;
}

nlohmann::json RotaJsonStorage::ArchiveToJson(ScheduleArchive const & archive)
{
  nlohmann::json document = nlohmann::json::object();
  for (auto const & [weekKey, schedule] : archive)
    document[weekKey] = WeekScheduleToJson(schedule);
  return document;
}

ScheduleArchive RotaJsonStorage::ArchiveFromJson(nlohmann::json const & document, utils::ScLogger & logger)
{
  ScheduleArchive archive;
  if (!document.is_object())
  {
    logger.Warning("RotaJsonStorage: archive document is not an object, ignoring it");
    return archive;
  }

  for (auto const & [weekKey, week] : document.items())
  {
    try
    {
      archive[weekKey] = WeekScheduleFromJson(week);
    }
    catch (RotaPersistenceException const & exception)
    {
      logger.Warning("RotaJsonStorage: skipping archived week `", weekKey, "`: ", exception.what());
    }
  }
  return archive;
}

nlohmann::json RotaJsonStorage::ReasonsToJson(UnassignedReasons const & reasons)
{
  nlohmann::json document = nlohmann::json::object();
  for (auto const & [slot, reason] : reasons)
    document[slot] = reason;
  return document;
}

UnassignedReasons RotaJsonStorage::ReasonsFromJson(nlohmann::json const & document)
{
  UnassignedReasons reasons;
  if (!document.is_object())
    return reasons;

  for (auto const & [slot, reason] : document.items())
  {
    if (reason.is_string())
      reasons[slot] = reason.get<std::string>();
  }
  return reasons;
}

RotaConfig RotaJsonStorage::LoadConfig(std::string const & path, utils::ScLogger & logger)
{
  RotaConfig config;
  nlohmann::json const document = LoadDocument(path, logger);

  ReadInt(document, "minRestHours", config.minRestHours, logger);
  ReadInt(document, "saturdayStreakLimit", config.saturdayStreakLimit, logger);
  ReadInt(document, "publishStreakLimit", config.publishStreakLimit, logger);
  ReadInt(document, "defaultMaxShifts", config.defaultMaxShifts, logger);
  ReadString(document, "constraintsPath", config.constraintsPath, logger);
  ReadString(document, "shiftsPath", config.shiftsPath, logger);
  ReadString(document, "archivePath", config.archivePath, logger);

  return config;
}
