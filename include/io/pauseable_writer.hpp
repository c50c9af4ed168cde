#pragma once
#include "io/writer_layer.hpp"
#include "sync/latch.hpp"
#include <chrono>
#include <thread>

// Пауза только задерживает запись, буфер уходит дальше целиком.
template<typename NextLayer>
class Pauseable_writer : public Writer_layer<Pauseable_writer<NextLayer>, NextLayer>
{
    public:
        static constexpr std::chrono::milliseconds default_poll_interval{500};

        Pauseable_writer(NextLayer next, Latch_monitor paused, std::chrono::milliseconds poll_interval = default_poll_interval)
        : Writer_layer<Pauseable_writer<NextLayer>, NextLayer>(std::forward<NextLayer>(next)),
          paused_(std::move(paused)), poll_interval_(poll_interval)
        {}

        std::size_t write_chunk(boost::asio::const_buffer chunk, boost::system::error_code& ec)
        {
            while(paused_.active())
                std::this_thread::sleep_for(poll_interval_);
            return this->next_.write_some(chunk, ec);
        }

    private:
        Latch_monitor paused_;

        std::chrono::milliseconds poll_interval_; // как часто проверять флаг паузы
};
