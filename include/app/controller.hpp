#pragma once
#include "app/cli.hpp"
#include "config/transfer_config.hpp"
#include "config/valve_config.hpp"
#include "progress/transfer_progress.hpp"
#include "sync/latch.hpp"
#include "utils/timer.hpp"
#include <boost/asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <termios.h>

struct Controller_options
{
    bool draw_status = false; // рисовать ли в stderr
    bool keyboard = false; // читать клавиши с /dev/tty
    Cli_options overrides; // накладываются на файл после каждого перечитывания
};

// Поток управления: сигналы и клавиши -> флаги и конфигурация, периодическая строка статуса.
// Единственный писатель Config_control и обоих Latch.
class Controller
{
    public:
        static constexpr std::uint32_t KEY_LIMIT_STEP = 10; // шаг лимита для +/- и стрелок

        Controller(Config_control& config, Latch& pause, Latch& cancel,
            Progress_monitor progress, Rate_monitor rates,
            Valve_Config& valve_config, Controller_options options); // конструктор

        Controller(const Controller&) = delete;
        Controller& operator=(const Controller&) = delete;

        ~Controller();

        void run(); // крутит io_context в текущем потоке до shutdown или отмены

        void shutdown(); // можно звать из любого потока

        void handle_signal(int signal_number); // реакция на сигнал (вызывается в потоке управления)

        // + = стрелка вправо: лимит +10, - _ стрелка влево: лимит -10, t: лимит вкл/выкл,
        // u: следующая единица, b/l/n: байты/строки/записи, p или пробел: пауза
        void handle_input(std::string_view input);

        std::string status() const; // текущая строка статуса

        bool cancelled() const {return cancel_.active();};

    private:
        void await_signal(); // ждать следующий сигнал

        void open_keyboard();

        void await_key();

        void restore_terminal();

        void on_tick(); // перерисовка по таймеру

        void draw(bool final);

        void stop(); // снять ожидания, после этого run возвращается

        void reload_config();

    private:
        boost::asio::io_context io_context_;

        boost::asio::signal_set signals_;

        boost::asio::posix::stream_descriptor tty_; // открыт только при options.keyboard

        std::optional<termios> saved_mode_; // режим терминала до нас

        std::array<char, 16> key_buffer_;

        std::shared_ptr<Timer> ticker_; // период перерисовки

        Config_control& config_;

        Latch& pause_;

        Latch& cancel_;

        Progress_monitor progress_;

        Rate_monitor rates_;

        Valve_Config& valve_config_;

        Controller_options options_;

        std::chrono::milliseconds window_; // после стольких мс без записей скорость считается нулевой

        bool stopped_;
};
