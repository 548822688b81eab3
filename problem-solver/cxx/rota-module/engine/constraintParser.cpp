#include "constraintParser.hpp"
#include "shiftCatalog.hpp"

#include "utils/stringFormatter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace
{
std::string const KEYWORD_DAY_OFF = "doesn't work";
std::string const KEYWORD_FORBIDDEN_SHIFT = "cannot work";
std::string const KEYWORD_ONLY_SHIFTS = "can only work";
std::string const KEYWORD_UP_TO = "up to";
std::string const KEYWORD_SHIFTS = "shifts";

std::string StripPunctuation(std::string str)
{
  while (!str.empty() && (str.back() == '.' || str.back() == ',' || str.back() == ';'))
    str.pop_back();
  return StringFormatter::Trim(str);
}
}  // namespace

ConstraintParser::ConstraintParser(utils::ScLogger & logger, int defaultMaxShifts)
  : m_logger(logger)
  , m_defaultMaxShifts(defaultMaxShifts)
{
  m_rules.push_back(
      {"day off",
       [](std::string const & lowered) {
         return lowered.find(KEYWORD_DAY_OFF) != std::string::npos;
       },
       [](std::string const & line, std::string const & lowered, ConstraintUpdate & update) {
         std::string day = StripPunctuation(Remainder(line, lowered, KEYWORD_DAY_OFF));
         if (StringFormatter::StartsWith(StringFormatter::ToLower(day), "on "))
           day = StringFormatter::Trim(day.substr(3));
         if (!day.empty())
           update.restrictedDays.push_back(StringFormatter::Capitalize(day));
       }});

  m_rules.push_back(
      {"forbidden shift",
       [](std::string const & lowered) {
         return lowered.find(KEYWORD_FORBIDDEN_SHIFT) != std::string::npos;
       },
       [](std::string const & line, std::string const & lowered, ConstraintUpdate & update) {
         std::string const shift = StripPunctuation(Remainder(line, lowered, KEYWORD_FORBIDDEN_SHIFT));
         if (!shift.empty())
           update.restrictedShifts.push_back(NormalizeShift(shift));
       }});

  m_rules.push_back(
      {"allowed shifts",
       [](std::string const & lowered) {
         return lowered.find(KEYWORD_ONLY_SHIFTS) != std::string::npos;
       },
       [](std::string const & line, std::string const & lowered, ConstraintUpdate & update) {
         std::string const remainder = StripPunctuation(Remainder(line, lowered, KEYWORD_ONLY_SHIFTS));
         for (auto const & part : StringFormatter::ParseList(remainder, ','))
         {
           for (auto const & token : StringFormatter::SplitByWord(part, " or "))
           {
             std::string const shift = StringFormatter::Trim(token);
             if (!shift.empty())
               update.allowedShifts.push_back(NormalizeShift(shift));
           }
         }
       }});

  m_rules.push_back(
      {"max shifts",
       [](std::string const & lowered) {
         return lowered.find(KEYWORD_UP_TO) != std::string::npos
                && lowered.find(KEYWORD_SHIFTS) != std::string::npos;
       },
       [this](std::string const & line, std::string const & lowered, ConstraintUpdate & update) {
         update.maxShifts = ParseMaxShifts(line, lowered);
       }});
}

std::string ConstraintParser::Remainder(
    std::string const & line,
    std::string const & loweredLine,
    std::string const & keyword)
{
  size_t const pos = loweredLine.find(keyword);
  if (pos == std::string::npos)
    return "";
  return StringFormatter::Trim(line.substr(pos + keyword.size()));
}

std::string ConstraintParser::NormalizeShift(std::string const & shift)
{
  if (ShiftCatalog::IsValidLabel(shift))
    return ShiftCatalog::Canonicalize(shift);
  return shift;
}

int ConstraintParser::ParseMaxShifts(std::string const & line, std::string const & loweredLine) const
{
  size_t const from = loweredLine.find(KEYWORD_UP_TO) + KEYWORD_UP_TO.size();
  size_t const to = loweredLine.find(KEYWORD_SHIFTS, from);
  if (to == std::string::npos)
  {
    m_logger.Warning("ConstraintParser: no shift count in `", line, "`, using ", m_defaultMaxShifts);
    return m_defaultMaxShifts;
  }

  std::string const number = StringFormatter::Trim(line.substr(from, to - from));
  bool const isNumber = !number.empty() && number.size() < 6
                        && std::all_of(number.begin(), number.end(), [](unsigned char c) {
                             return std::isdigit(c);
                           });
  if (!isNumber || std::stoi(number) <= 0)
  {
    m_logger.Warning("ConstraintParser: cannot read shift count `", number, "`, using ", m_defaultMaxShifts);
    return m_defaultMaxShifts;
  }

  return std::stoi(number);
}

ConstraintUpdate ConstraintParser::Parse(std::string const & text) const
{
  ConstraintUpdate update;

  std::istringstream stream(text);
  std::string rawLine;
  while (std::getline(stream, rawLine))
  {
    std::string const line = StringFormatter::Trim(rawLine);
    if (line.empty())
      continue;

    std::string const lowered = StringFormatter::ToLower(line);

    MatcherRule const * matched = nullptr;
    size_t matchCount = 0;
    for (auto const & rule : m_rules)
    {
      if (!rule.matches(lowered))
        continue;
      if (matched == nullptr)
        matched = &rule;
      ++matchCount;
    }

    if (matched == nullptr)
    {
      m_logger.Debug("ConstraintParser: no rule for `", line, "`");
      update.unrecognizedLines.push_back(line);
      continue;
    }

    if (matchCount > 1)
    {
      m_logger.Warning("ConstraintParser: `", line, "` matches several rules, applying `", matched->name, "`");
      update.ambiguousLines.push_back(line);
    }

    matched->apply(line, lowered, update);
  }

  return update;
}

WorkerConstraints ConstraintParser::ToConstraints(ConstraintUpdate const & update) const
{
  WorkerConstraints constraints;
  constraints.maxShifts = update.maxShifts.value_or(m_defaultMaxShifts);
  constraints.restrictedDays.insert(update.restrictedDays.cbegin(), update.restrictedDays.cend());
  constraints.restrictedShifts.insert(update.restrictedShifts.cbegin(), update.restrictedShifts.cend());
  constraints.allowedShifts.insert(update.allowedShifts.cbegin(), update.allowedShifts.cend());
  return constraints;
}

WorkerConstraints ConstraintParser::ParseConstraints(std::string const & text) const
{
  return ToConstraints(Parse(text));
}
