#pragma once

#include "engine/constraintStore.hpp"
#include "engine/rotaConfig.hpp"
#include "engine/shiftCatalog.hpp"
#include "engine/weekSchedule.hpp"

#include <sc-memory/utils/sc_logger.hpp>

#include <nlohmann/json.hpp>

#include <string>

// Чтение и запись JSON-документов ротации:
//   ограничения  { "Имя": { "allowedShifts": [], "restrictedDays": [], "restrictedShifts": [], "maxShifts": 5 } }
//   смены        { "16-1": true }
//   архив        { "YYYY-MM-DD": { "Sunday 2026-10-18": { "16-1": "Имя" } } }
// Отсутствующий или повреждённый документ даёт пустое состояние и предупреждение в лог.
class RotaJsonStorage
{
public:
  static nlohmann::json LoadDocument(std::string const & path, utils::ScLogger & logger);
  static void SaveDocument(std::string const & path, nlohmann::json const & document);
  // Некорректные UTF-8 последовательности заменяются на U+FFFD
  static std::string Dump(nlohmann::json const & document, int indent = -1);

  static nlohmann::json ConstraintsToJson(ConstraintStore const & store);
  static ConstraintStore ConstraintsFromJson(
      nlohmann::json const & document,
      utils::ScLogger & logger,
      int defaultMaxShifts = DEFAULT_MAX_SHIFTS);

  static nlohmann::json ShiftCatalogToJson(ShiftCatalog const & catalog);
  static ShiftCatalog ShiftCatalogFromJson(nlohmann::json const & document, utils::ScLogger & logger);

  static nlohmann::json WeekScheduleToJson(WeekSchedule const & schedule);
  static WeekSchedule WeekScheduleFromJson(nlohmann::json const & document);

  static nlohmann::json ArchiveToJson(ScheduleArchive const & archive);
  static ScheduleArchive ArchiveFromJson(nlohmann::json const & document, utils::ScLogger & logger);

  static nlohmann::json ReasonsToJson(UnassignedReasons const & reasons);
  static UnassignedReasons ReasonsFromJson(nlohmann::json const & document);

  static RotaConfig LoadConfig(std::string const & path, utils::ScLogger & logger);

private:
  static WorkerConstraints ConstraintsFromEntry(
      std::string const & name,
      nlohmann::json const & entry,
      int defaultMaxShifts,
      utils::ScLogger & logger);
};
