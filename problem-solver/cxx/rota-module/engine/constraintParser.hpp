#pragma once

#include "rotaTypes.hpp"

#include <sc-memory/utils/sc_logger.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Частичное обновление ограничений, собранное из текста
struct ConstraintUpdate
{
  std::vector<std::string> restrictedDays;
  std::vector<std::string> restrictedShifts;
  std::vector<std::string> allowedShifts;
  std::optional<int> maxShifts;

  // Строки, подходящие сразу под несколько правил (применено первое)
  std::vector<std::string> ambiguousLines;
  std::vector<std::string> unrecognizedLines;
};

// Разбирает ограничения бармена, записанные свободным текстом, по одному правилу на строку:
//   "doesn't work Monday"       -> выходной день
//   "cannot work 16-1"          -> запрещённая смена
//   "can only work 8-16 or 16-1"-> белый список смен
//   "up to 3 shifts"            -> максимум смен в неделю
// Ключевые слова ищутся без учёта регистра, правила проверяются в указанном порядке
// и срабатывает первое подходящее.
class ConstraintParser
{
public:
  explicit ConstraintParser(utils::ScLogger & logger, int defaultMaxShifts = DEFAULT_MAX_SHIFTS);
  ConstraintParser(ConstraintParser const &) = delete;
  ConstraintParser & operator=(ConstraintParser const &) = delete;

  ConstraintUpdate Parse(std::string const & text) const;
  WorkerConstraints ParseConstraints(std::string const & text) const;
  WorkerConstraints ToConstraints(ConstraintUpdate const & update) const;

private:
  struct MatcherRule
  {
    std::string name;
    std::function<bool(std::string const & loweredLine)> matches;
    std::function<void(std::string const & line, std::string const & loweredLine, ConstraintUpdate & update)> apply;
  };

  static std::string Remainder(std::string const & line, std::string const & loweredLine, std::string const & keyword);
  static std::string NormalizeShift(std::string const & shift);
  int ParseMaxShifts(std::string const & line, std::string const & loweredLine) const;

  utils::ScLogger & m_logger;
  int m_defaultMaxShifts;
  std::vector<MatcherRule> m_rules;
};
