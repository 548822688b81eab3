#pragma once

#include "rotaTypes.hpp"

#include <map>
#include <string>
#include <vector>

class ConstraintParser;

class ConstraintStore
{
public:
  explicit ConstraintStore(int defaultMaxShifts = DEFAULT_MAX_SHIFTS);

  // Бармен без ограничений с лимитом смен по умолчанию
  void AddWorker(std::string const & name);
  void AddWorker(std::string const & name, WorkerConstraints const & constraints);
  void RemoveWorker(std::string const & name);
  void RenameWorker(std::string const & oldName, std::string const & newName);

  void SetConstraints(std::string const & name, WorkerConstraints const & constraints);
  // Разбирает свободный текст и заменяет им ограничения бармена
  WorkerConstraints const & ApplyText(
      std::string const & name,
      std::string const & text,
      ConstraintParser const & parser);

  bool Contains(std::string const & name) const;
  WorkerConstraints const & GetConstraints(std::string const & name) const;
  std::vector<std::string> GetWorkerNames() const;
  std::map<std::string, WorkerConstraints> const & GetWorkers() const;
  size_t Size() const;
  int GetDefaultMaxShifts() const;

private:
  static void ValidateName(std::string const & name);
  static void ValidateConstraints(std::string const & name, WorkerConstraints const & constraints);

  int m_defaultMaxShifts;
  std::map<std::string, WorkerConstraints> m_workers;
};
