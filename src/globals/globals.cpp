// в этом файле объявляются все глобальные данные

#include "globals/globals.hpp"

namespace __PVALVE_GLOBALS__
{
    std::atomic<bool> LOG_ON{false}; // пишем ли лог (по умолчанию нет: stdout занят данными)

    Logger LOGGER(Logger::LOG_LEVEL::INFO); // объект класса Logger, через который происходит взаимодействие с логами из других частей кода
    Logger DEBUG_LOGGER(Logger::LOG_LEVEL::DEBUG);
}
