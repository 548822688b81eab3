#include "constraintStore.hpp"
#include "constraintParser.hpp"
#include "rotaExceptions.hpp"

#include "utils/stringFormatter.hpp"

void ConstraintStore::ValidateName(std::string const & name)
{
  if (StringFormatter::Trim(name).empty())
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender name must not be empty");
  if (!StringFormatter::IsValidUtf8(name))
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender name is not valid UTF-8");
  if (name == UNASSIGNED)
    SC_THROW_EXCEPTION(RotaValidationException, "`" << UNASSIGNED << "` is reserved and cannot be a bartender name");
}

void ConstraintStore::ValidateConstraints(std::string const & name, WorkerConstraints const & constraints)
{
  if (constraints.maxShifts <= 0)
    SC_THROW_EXCEPTION(
        RotaValidationException,
        "Max shifts for `" << name << "` must be positive, got " << constraints.maxShifts);
}

ConstraintStore::ConstraintStore(int defaultMaxShifts)
  : m_defaultMaxShifts(defaultMaxShifts)
{
}

void ConstraintStore::AddWorker(std::string const & name)
{
  WorkerConstraints constraints;
  constraints.maxShifts = m_defaultMaxShifts;
  AddWorker(name, constraints);
}

void ConstraintStore::AddWorker(std::string const & name, WorkerConstraints const & constraints)
{
  ValidateName(name);
  ValidateConstraints(name, constraints);
  if (Contains(name))
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender `" << name << "` already exists");

  m_workers.emplace(name, constraints);
}

void ConstraintStore::RemoveWorker(std::string const & name)
{
  if (m_workers.erase(name) == 0)
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender `" << name << "` does not exist");
}

void ConstraintStore::RenameWorker(std::string const & oldName, std::string const & newName)
{
  auto const it = m_workers.find(oldName);
  if (it == m_workers.end())
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender `" << oldName << "` does not exist");

  ValidateName(newName);
  if (Contains(newName))
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender `" << newName << "` already exists");

  WorkerConstraints const constraints = it->second;
  m_workers.erase(it);
  m_workers.emplace(newName, constraints);
}

void ConstraintStore::SetConstraints(std::string const & name, WorkerConstraints const & constraints)
{
  auto const it = m_workers.find(name);
  if (it == m_workers.end())
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender `" << name << "` does not exist");

  ValidateConstraints(name, constraints);
  it->second = constraints;
}

WorkerConstraints const & ConstraintStore::ApplyText(
    std::string const & name,
    std::string const & text,
    ConstraintParser const & parser)
{
  SetConstraints(name, parser.ParseConstraints(text));
  return GetConstraints(name);
}

bool ConstraintStore::Contains(std::string const & name) const
{
  return m_workers.count(name) > 0;
}

WorkerConstraints const & ConstraintStore::GetConstraints(std::string const & name) const
{
  auto const it = m_workers.find(name);
  if (it == m_workers.cend())
    SC_THROW_EXCEPTION(RotaValidationException, "Bartender `" << name << "` does not exist");
  return it->second;
}

std::vector<std::string> ConstraintStore::GetWorkerNames() const
{
  std::vector<std::string> names;
  names.reserve(m_workers.size());
  for (auto const & [name, constraints] : m_workers)
    names.push_back(name);
  return names;
}

std::map<std::string, WorkerConstraints> const & ConstraintStore::GetWorkers() const
{
  return m_workers;
}

size_t ConstraintStore::Size() const
{
  return m_workers.size();
}

int ConstraintStore::GetDefaultMaxShifts() const
{
  return m_defaultMaxShifts;
}
