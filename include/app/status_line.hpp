#pragma once
#include "config/transfer_config.hpp"
#include "progress/transfer_progress.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

struct Status_view // все, что нужно для одной строки статуса
{
    Cumulative_progress cumulative;
    Transfer_rate rate;
    Transfer_config config;
    bool paused = false;
};

std::string format_status(const Status_view& view);

std::string format_binary(double value); // 1536 -> "1.50Ki"

std::string format_si(double value); // 1500 -> "1.50k"

std::string format_duration(std::chrono::steady_clock::duration duration); // h:mm:ss

// скорость упирается в лимит: превышает его или отстает не больше чем на 10% или 1 единицу
bool rate_saturated(double rate, std::optional<std::uint32_t> limit);
