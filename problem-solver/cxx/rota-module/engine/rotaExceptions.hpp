#pragma once

#include <sc-memory/sc_memory.hpp>

#include <string>
#include <vector>

// Ошибка входных данных: имена сотрудников, координаты слотов, метки смен
class RotaValidationException : public utils::ScException
{
public:
  RotaValidationException(std::string const & description, std::string const & msg)
    : utils::ScException("RotaValidationException: " + description, msg)
  {
  }
};

class ShiftFormatException : public RotaValidationException
{
public:
  ShiftFormatException(std::string const & description, std::string const & msg)
    : RotaValidationException("ShiftFormatException: " + description, msg)
  {
  }
};

class RotaPersistenceException : public utils::ScException
{
public:
  RotaPersistenceException(std::string const & description, std::string const & msg)
    : utils::ScException("RotaPersistenceException: " + description, msg)
  {
  }
};

// Публикация недели отклонена: кто-то из барменов набирает слишком длинную серию суббот
class PublishBlockedException : public utils::ScException
{
public:
  explicit PublishBlockedException(std::vector<std::string> const & violators)
    : utils::ScException("PublishBlockedException: " + BuildMessage(violators), BuildMessage(violators))
    , m_violators(violators)
  {
  }

  std::vector<std::string> const & GetViolators() const
  {
    return m_violators;
  }

private:
  static std::string BuildMessage(std::vector<std::string> const & violators)
  {
    std::string message = "Saturday streak limit reached for: ";
    for (size_t i = 0; i < violators.size(); ++i)
    {
      if (i > 0)
        message += ", ";
      message += violators[i];
    }
    return message;
  }

  std::vector<std::string> m_violators;
};
