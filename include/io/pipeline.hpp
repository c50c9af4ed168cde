#pragma once
#include "io/rate_limited_writer.hpp"
#include "io/pauseable_writer.hpp"
#include "io/cancellable_writer.hpp"
#include "io/windowed_progress_writer.hpp"
#include "io/progress_writer.hpp"
#include "config/transfer_config.hpp"
#include "sync/latch.hpp"
#include <chrono>

struct Pipeline_options
{
    std::chrono::milliseconds window{1000}; // окно мгновенной скорости
    std::chrono::milliseconds pause_poll{500}; // период опроса флага паузы
};

// Порядок слоев от внешнего к внутреннему:
// ограничение скорости -> пауза -> отмена -> скорость за окно -> общий прогресс -> sink
template<typename Sink>
using Valve_writer =
    Rate_limited_writer<
        Pauseable_writer<
            Cancellable_writer<
                Windowed_progress_writer<
                    Progress_writer<Sink>>>>>;

template<typename Sink>
struct Pipeline
{
    Valve_writer<Sink> writer; // для потока передачи
    Config_control config; // дальше - для потока управления
    Latch pause;
    Latch cancel;
    Progress_monitor progress;
    Rate_monitor windowed;
};

template<typename Sink>
Pipeline<Sink> make_pipeline(Sink sink, Transfer_config initial, Pipeline_options options = {})
{
    Config_control config(initial);
    Latch pause;
    Latch cancel;

    Progress_writer<Sink> progress_writer(std::forward<Sink>(sink));
    auto progress = progress_writer.progress();

    Windowed_progress_writer<Progress_writer<Sink>> windowed_writer(std::move(progress_writer), options.window);
    auto windowed = windowed_writer.rates();

    Cancellable_writer<Windowed_progress_writer<Progress_writer<Sink>>> cancellable_writer(std::move(windowed_writer), cancel.watch());
    Pauseable_writer<Cancellable_writer<Windowed_progress_writer<Progress_writer<Sink>>>> pauseable_writer(
        std::move(cancellable_writer), pause.watch(), options.pause_poll);
    Valve_writer<Sink> writer(std::move(pauseable_writer), config.monitor());

    return Pipeline<Sink>{std::move(writer), std::move(config), std::move(pause), std::move(cancel),
        std::move(progress), std::move(windowed)};
}
