#include "stringFormatter.hpp"

#include <algorithm>
#include <cctype>

void StringFormatter::Ltrim(std::string & str)
{
  size_t start_pos = 0;
  while (start_pos < str.size() and std::isspace(static_cast<unsigned char>(str[start_pos])))
  {
    start_pos++;
  }
  str = str.substr(start_pos);
}

void StringFormatter::Rtrim(std::string & str)
{
  int start_pos = static_cast<int>(str.size()) - 1;
  while (start_pos >= 0 and std::isspace(static_cast<unsigned char>(str[start_pos])))
  {
    start_pos--;
  }
  int length = start_pos + 1;
  str = str.substr(0, length);
}

std::string StringFormatter::Trim(std::string str)
{
  Ltrim(str);
  Rtrim(str);
  return str;
}

std::vector<std::string> StringFormatter::Split(std::string const & str, char const & separator)
{
  std::vector<std::string> result_of_split;
  size_t start_pos = 0;
  size_t pos = 0;

  while ((pos = str.find(separator, start_pos)) != std::string::npos)
  {
    if (pos != start_pos)
    {
      result_of_split.push_back(str.substr(start_pos, pos - start_pos));
    }
    start_pos = pos + 1;
  }

  if (start_pos < str.length())
  {
    result_of_split.push_back(str.substr(start_pos));
  }

  return result_of_split;
}

// Разделитель ищется без учёта регистра: "Or" и "OR" тоже считаются разделителем
std::vector<std::string> StringFormatter::SplitByWord(std::string const & str, std::string const & separator)
{
  std::vector<std::string> result_of_split;
  if (separator.empty())
  {
    result_of_split.push_back(str);
    return result_of_split;
  }

  std::string const lowered = ToLower(str);
  std::string const loweredSeparator = ToLower(separator);
  size_t start_pos = 0;
  size_t pos = 0;

  while ((pos = lowered.find(loweredSeparator, start_pos)) != std::string::npos)
  {
    result_of_split.push_back(str.substr(start_pos, pos - start_pos));
    start_pos = pos + separator.size();
  }
  result_of_split.push_back(str.substr(start_pos));

  return result_of_split;
}

std::vector<std::string> StringFormatter::ParseList(std::string const & listStr, char const & separator)
{
  std::vector<std::string> items = Split(listStr, separator);
  std::vector<std::string> result;
  for (auto & item : items)
  {
    item = Trim(item);
    if (!item.empty())
      result.push_back(item);
  }
  return result;
}

std::string StringFormatter::ToLower(std::string str)
{
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

std::string StringFormatter::Capitalize(std::string const & str)
{
  std::string result = ToLower(str);
  if (!result.empty())
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
  return result;
}

bool StringFormatter::StartsWith(std::string const & str, std::string const & prefix)
{
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringFormatter::IsValidUtf8(std::string const & str)
{
  size_t i = 0;
  while (i < str.size())
  {
    auto const lead = static_cast<unsigned char>(str[i]);
    size_t length = 0;
    unsigned int codePoint = 0;
    if (lead < 0x80)
    {
      ++i;
      continue;
    }
    else if ((lead & 0xE0) == 0xC0)
    {
      length = 2;
      codePoint = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
      length = 3;
      codePoint = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
      length = 4;
      codePoint = lead & 0x07;
    }
    else
      return false;

    if (i + length > str.size())
      return false;

    for (size_t j = 1; j < length; ++j)
    {
      auto const next = static_cast<unsigned char>(str[i + j]);
      if ((next & 0xC0) != 0x80)
        return false;
      codePoint = (codePoint << 6) | (next & 0x3F);
    }

    // Избыточные кодировки, суррогаты и значения за пределами Unicode
    if ((length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800)
        || (length == 4 && codePoint < 0x10000) || codePoint > 0x10FFFF
        || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
      return false;

    i += length;
  }
  return true;
}
