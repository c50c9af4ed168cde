#include "app/controller.hpp"
#include "app/status_line.hpp"
#include "globals/globals.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

Controller::Controller(Config_control& config, Latch& pause, Latch& cancel,
    Progress_monitor progress, Rate_monitor rates,
    Valve_Config& valve_config, Controller_options options)
: signals_(io_context_, SIGINT, SIGTERM), tty_(io_context_), key_buffer_(),
  config_(config), pause_(pause), cancel_(cancel),
  progress_(std::move(progress)), rates_(std::move(rates)),
  valve_config_(valve_config), options_(std::move(options)),
  window_(valve_config.get_settings().window_milliseconds), stopped_(false)
{
    signals_.add(SIGUSR1);
    signals_.add(SIGUSR2);
    signals_.add(SIGHUP);
    ticker_ = std::make_shared<Timer>(io_context_.get_executor(),
        static_cast<std::size_t>(valve_config_.get_settings().status_interval_milliseconds));
    ticker_->set_repeating(true);
    ticker_->set_callback_func([this](){on_tick();});
}

Controller::~Controller()
{
    restore_terminal();
}

void Controller::run()
{
    await_signal();
    if(options_.keyboard)
        open_keyboard();
    ticker_->start();
    draw(false);
    io_context_.run();
    draw(true);
}

void Controller::shutdown()
{
    boost::asio::post(io_context_, [this](){stop();});
}

void Controller::stop()
{
    if(stopped_)
        return;
    stopped_ = true;
    ticker_->stop();
    boost::system::error_code ec;
    signals_.cancel(ec);
    restore_terminal();
}

void Controller::await_signal()
{
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number)
    {
        if(ec || stopped_)
            return;
        handle_signal(signal_number);
        if(!stopped_)
            await_signal();
    });
}

void Controller::open_keyboard()
{
    int fd = ::open("/dev/tty", O_RDONLY | O_NOCTTY | O_CLOEXEC);
    if(fd < 0)
    {
        if(__PVALVE_GLOBALS__::LOG_ON)
            __PVALVE_GLOBALS__::LOGGER << "Keyboard control unavailable: " << std::strerror(errno) << std::endl;
        return;
    }
    termios mode;
    if(::tcgetattr(fd, &mode) != 0)
    {
        ::close(fd);
        return;
    }
    saved_mode_ = mode;
    mode.c_lflag &= ~(ICANON | ECHO); // ISIG оставляем: Ctrl-C по-прежнему дает SIGINT
    mode.c_cc[VMIN] = 1;
    mode.c_cc[VTIME] = 0;
    ::tcsetattr(fd, TCSANOW, &mode);
    tty_.assign(fd);
    await_key();
}

void Controller::await_key()
{
    tty_.async_read_some(boost::asio::buffer(key_buffer_), [this](const boost::system::error_code& ec, std::size_t length)
    {
        if(ec || stopped_)
            return;
        handle_input(std::string_view(key_buffer_.data(), length));
        if(!stopped_)
            await_key();
    });
}

void Controller::restore_terminal()
{
    if(!tty_.is_open())
        return;
    if(saved_mode_)
        ::tcsetattr(tty_.native_handle(), TCSANOW, &*saved_mode_);
    saved_mode_.reset();
    boost::system::error_code ec;
    tty_.close(ec);
}

void Controller::handle_input(std::string_view input)
{
    for(std::size_t i = 0; i < input.size(); ++i)
    {
        char key = input[i];
        if(input.substr(i, 3) == "\x1b[C") // стрелка вправо
        {
            key = '+';
            i += 2;
        }
        else if(input.substr(i, 3) == "\x1b[D") // стрелка влево
        {
            key = '-';
            i += 2;
        }
        switch(key)
        {
            case '+':
            case '=':
                config_.increase_limit(KEY_LIMIT_STEP);
                break;
            case '-':
            case '_':
                config_.decrease_limit(KEY_LIMIT_STEP);
                break;
            case 't':
                config_.toggle_limit();
                break;
            case 'u':
                config_.cycle_unit();
                break;
            case 'b':
                config_.set_unit(Unit::Byte);
                break;
            case 'l':
                config_.set_unit(Unit::Line);
                break;
            case 'n':
                config_.set_unit(Unit::Null);
                break;
            case 'p':
            case ' ':
                pause_.toggle();
                break;
            default:
                continue;
        }
        if(__PVALVE_GLOBALS__::LOG_ON)
            __PVALVE_GLOBALS__::LOGGER << "Key '" << key << "': limit " << config_.current().speed_limit.value()
                << (config_.current().speed_limit.enabled() ? "" : " (off)") << ", unit " << unit_name(config_.current().unit)
                << (pause_.active() ? ", paused" : "") << std::endl;
    }
    draw(false);
}

void Controller::handle_signal(int signal_number)
{
    switch(signal_number)
    {
        case SIGINT:
        case SIGTERM:
            pause_.off(); // иначе поток передачи так и останется в ожидании паузы
            cancel_.on();
            if(__PVALVE_GLOBALS__::LOG_ON)
                __PVALVE_GLOBALS__::LOGGER << "Cancel requested by signal " << signal_number << std::endl;
            stop();
            break;
        case SIGUSR1:
            pause_.toggle();
            if(__PVALVE_GLOBALS__::LOG_ON)
                __PVALVE_GLOBALS__::LOGGER << (pause_.active() ? "Paused" : "Resumed") << std::endl;
            draw(false);
            break;
        case SIGUSR2:
            config_.toggle_limit();
            if(__PVALVE_GLOBALS__::LOG_ON)
                __PVALVE_GLOBALS__::LOGGER << "Rate limit " << (config_.current().speed_limit.enabled() ? "enabled" : "disabled") << std::endl;
            draw(false);
            break;
        case SIGHUP:
            reload_config();
            draw(false);
            break;
        default:
            break;
    }
}

void Controller::reload_config()
{
    if(!valve_config_.reload())
    {
        if(__PVALVE_GLOBALS__::LOG_ON)
            __PVALVE_GLOBALS__::LOGGER << "Configuration reload from " << valve_config_.file_name() << " failed, keeping current settings" << std::endl;
        return;
    }
    apply_overrides(options_.overrides, valve_config_.get_settings()); // командная строка важнее файла
    auto config = config_.current();
    auto reloaded = valve_config_.transfer_config();
    config.speed_limit = reloaded.speed_limit;
    config.unit = reloaded.unit;
    if(reloaded.expected_size)
        config.expected_size = reloaded.expected_size;
    config_.send(config);
    if(__PVALVE_GLOBALS__::LOG_ON)
        __PVALVE_GLOBALS__::LOGGER << "Configuration reloaded: limit " << config.speed_limit.value()
            << (config.speed_limit.enabled() ? "" : " (off)") << ", unit " << unit_name(config.unit) << std::endl;
}

std::string Controller::status() const
{
    Status_view view;
    view.cumulative = progress_.get();
    view.rate = rates_.get();
    if(view.rate.expired(window_)) // за все окно не было записей
        view.rate = Transfer_rate{};
    view.config = config_.current();
    view.paused = pause_.active();
    return format_status(view);
}

void Controller::on_tick()
{
    draw(false);
    if(__PVALVE_GLOBALS__::LOG_ON)
        __PVALVE_GLOBALS__::DEBUG_LOGGER << status() << std::endl;
}

void Controller::draw(bool final)
{
    if(!options_.draw_status)
        return;
    std::cerr << '\r' << status() << "\x1b[K";
    if(final)
        std::cerr << std::endl;
    else
        std::cerr << std::flush;
}
