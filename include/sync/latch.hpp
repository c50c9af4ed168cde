#pragma once
#include "sync/watch.hpp"

// Флаг (пауза, отмена) для другого потока.
// Это состояние, а не событие: читатель видит только "включен ли сейчас",
// быстрое вкл-выкл между двумя опросами для него невидимо.
// Не стройте поверх Latch_monitor определение фронтов - переходы теряются.
class Latch_monitor
{
    public:
        explicit Latch_monitor(Watch_receiver<bool> receiver);

        bool active() const;

    private:
        Watch_receiver<bool> receiver_;
};

class Latch
{
    public:
        Latch(); // изначально выключен

        Latch(const Latch&) = delete; // у флага один владелец
        Latch& operator=(const Latch&) = delete;
        Latch(Latch&&) = default;
        Latch& operator=(Latch&&) = default;

        bool active() const {return active_;};

        void on();

        void off();

        void toggle();

        Latch_monitor watch() const; // новый читатель

    private:
        void publish();

    private:
        bool active_;

        Watch_sender<bool> sender_;
};
