#pragma once

#include <string>
#include <vector>

class StringFormatter
{
public:
  static void Ltrim(std::string & str);
  static void Rtrim(std::string & str);
  static std::string Trim(std::string str);
  static std::vector<std::string> Split(std::string const & str, char const & separator = ';');
  static std::vector<std::string> SplitByWord(std::string const & str, std::string const & separator);
  static std::vector<std::string> ParseList(std::string const & listStr, char const & separator = ',');
  static std::string ToLower(std::string str);
  static std::string Capitalize(std::string const & str);
  static bool StartsWith(std::string const & str, std::string const & prefix);
  static bool IsValidUtf8(std::string const & str);
};
