#include "app/cli.hpp"
#include "app/controller.hpp"
#include "config/valve_config.hpp"
#include "globals/globals.hpp"
#include "io/copy_stream.hpp"
#include "io/pipeline.hpp"
#include "io/stream_sink.hpp"
#include <boost/asio.hpp>
#include <boost/program_options/errors.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace
{
    using Descriptor = boost::asio::posix::stream_descriptor;

    Descriptor open_descriptor(boost::asio::io_context& context, int fd) // свой дубликат, чтобы asio мог его закрыть
    {
        int copy = ::dup(fd);
        if(copy < 0)
            throw boost::system::system_error(errno, boost::system::system_category(), "dup");
        return Descriptor(context, copy);
    }

    void init_logging(const Valve_Config::Valve_Settings& settings)
    {
        if(!settings.log_on)
            return;
        __PVALVE_GLOBALS__::LOGGER.init_logger(settings.log_file_name, static_cast<std::size_t>(settings.log_file_size_bytes));
        Logger::set_debug_enabled(settings.debug);
        __PVALVE_GLOBALS__::LOG_ON = true;
    }
}

int main(int argc, char** argv)
{
    Cli_options options;
    try
    {
        options = parse_command_line(argc, argv);
    }
    catch(const boost::program_options::error& ex)
    {
        std::cerr << "pvalve: " << ex.what() << "\n" << usage();
        return 2;
    }
    if(options.help)
    {
        std::cout << usage();
        return 0;
    }

    Valve_Config valve_config(options.config_file);
    apply_overrides(options, valve_config.get_settings());
    if(!Valve_Config::validate(valve_config.get_settings()))
        return 2;
    const auto& settings = valve_config.get_settings();
    init_logging(settings);

    std::signal(SIGPIPE, SIG_IGN); // закрытый читатель превращается в broken_pipe, а не в смерть процесса

    try
    {
        boost::asio::io_context io_context;
        auto input = open_descriptor(io_context, STDIN_FILENO);
        Stream_sink<Descriptor> sink(open_descriptor(io_context, STDOUT_FILENO));

        Pipeline_options pipeline_options;
        pipeline_options.window = std::chrono::milliseconds(settings.window_milliseconds);
        pipeline_options.pause_poll = std::chrono::milliseconds(settings.pause_poll_milliseconds);
        auto pipeline = make_pipeline(std::move(sink), valve_config.transfer_config(), pipeline_options);

        Controller_options control_options;
        control_options.draw_status = !options.quiet && ::isatty(STDERR_FILENO);
        control_options.keyboard = control_options.draw_status; // клавиши только при живом статусе
        control_options.overrides = options;
        Controller controller(pipeline.config, pipeline.pause, pipeline.cancel,
            pipeline.progress, pipeline.windowed, valve_config, control_options);

        if(__PVALVE_GLOBALS__::LOG_ON)
            __PVALVE_GLOBALS__::LOGGER << "Transfer started: " << controller.status() << std::endl;

        std::promise<Copy_result> done;
        auto finished = done.get_future();
        auto buffer_size = static_cast<std::size_t>(settings.buffer_size);
        std::thread transfer([&]()
        {
            try
            {
                done.set_value(copy_stream(input, pipeline.writer, buffer_size));
            }
            catch(...)
            {
                done.set_exception(std::current_exception()); // разберемся в основном потоке
            }
            controller.shutdown();
        });

        controller.run();

        // после отмены поток передачи может висеть в чтении stdin - ждем его ограниченное время
        auto grace = std::chrono::milliseconds(settings.pause_poll_milliseconds) + std::chrono::seconds(1);
        if(finished.wait_for(grace) != std::future_status::ready)
        {
            std::cerr << "pvalve: transfer cancelled while waiting for input" << std::endl;
            transfer.detach();
            std::_Exit(1);
        }
        transfer.join();

        auto result = finished.get();
        if(__PVALVE_GLOBALS__::LOG_ON)
            __PVALVE_GLOBALS__::LOGGER << "Transfer finished: " << result.bytes_copied << " bytes, "
                << (result.error ? result.error.message() : std::string("ok")) << std::endl;
        if(result.error)
        {
            if(!controller.cancelled())
                std::cerr << "pvalve: " << result.error.message() << std::endl;
            return 1;
        }
    }
    catch(const std::exception& ex)
    {
        std::cerr << "pvalve: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
