#pragma once
#include "config/transfer_config.hpp"
#include "sync/watch.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>

struct Transfer_progress // счетчики переданного
{
    std::uint64_t bytes_transferred = 0;
    std::uint64_t lines_transferred = 0;
    std::uint64_t nulls_transferred = 0;

    static Transfer_progress measure(std::span<const char> data); // посчитать байты, '\n' и '\0' в срезе

    std::uint64_t count(Unit unit) const; // счетчик для выбранной единицы

    Transfer_progress& operator+=(const Transfer_progress& other);

    bool operator==(const Transfer_progress&) const = default;
};

Transfer_progress operator+(Transfer_progress lhs, const Transfer_progress& rhs);

struct Cumulative_progress // накопленное с начала передачи, только растет
{
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();
    Transfer_progress progress;

    std::chrono::steady_clock::duration elapsed() const;

    std::optional<double> ratio_of(std::optional<std::uint64_t> expected_size) const; // доля от ожидаемого размера, не больше 1
};

struct Transfer_rate // единиц в секунду за окно
{
    double bytes_per_sec = 0.0;
    double lines_per_sec = 0.0;
    double nulls_per_sec = 0.0;
    std::chrono::steady_clock::time_point measured_at{}; // когда посчитано

    double per_sec(Unit unit) const;

    // с момента расчета прошло целое окно: образцов в окне уже нет, скорость 0
    bool expired(std::chrono::steady_clock::duration window,
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const;
};

// сумма образцов окна, деленная на длину окна в секундах
Transfer_rate windowed_mean(const std::optional<Transfer_progress>& sum, std::chrono::steady_clock::duration window);

using Progress_monitor = Watch_receiver<Cumulative_progress>;
using Rate_monitor = Watch_receiver<Transfer_rate>;
