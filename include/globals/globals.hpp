// в этом файле идут объявление по типу "extern something"
#pragma once

#include "logger/logger.hpp"
#include <atomic>

namespace __PVALVE_GLOBALS__
{
    extern std::atomic<bool> LOG_ON;
    extern Logger LOGGER;
    extern Logger DEBUG_LOGGER;
}
