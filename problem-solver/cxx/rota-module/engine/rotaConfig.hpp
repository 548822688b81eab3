#pragma once

#include <string>

struct RotaConfig
{
  int minRestHours = 8;
  // Серия суббот, начиная с которой бармен не ставится на субботу при генерации
  int saturdayStreakLimit = 3;
  // Серия суббот, которую публикация не допускает
  int publishStreakLimit = 4;
  int defaultMaxShifts = 5;

  std::string constraintsPath;
  std::string shiftsPath;
  std::string archivePath;
};
