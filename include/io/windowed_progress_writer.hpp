#pragma once
#include "io/writer_layer.hpp"
#include "progress/sum_queue.hpp"
#include "progress/transfer_progress.hpp"

// Мгновенная скорость: сумма за последнее окно / длина окна.
// Длина окна задается при создании и больше не меняется.
template<typename NextLayer>
class Windowed_progress_writer : public Writer_layer<Windowed_progress_writer<NextLayer>, NextLayer>
{
    public:
        Windowed_progress_writer(NextLayer next, std::chrono::steady_clock::duration window)
        : Writer_layer<Windowed_progress_writer<NextLayer>, NextLayer>(std::forward<NextLayer>(next)),
          queue_(window), sender_(Transfer_rate{})
        {}

        std::size_t write_chunk(boost::asio::const_buffer chunk, boost::system::error_code& ec)
        {
            auto written = this->next_.write_some(chunk, ec);
            if(written > 0)
            {
                auto now = std::chrono::steady_clock::now();
                auto stats = queue_.push_and_stats(Transfer_progress::measure(this->as_span(chunk).first(written)), now);
                auto rate = windowed_mean(stats.sum, queue_.max_age());
                rate.measured_at = now;
                sender_.send(rate);
            }
            return written;
        }

        Rate_monitor rates() const {return sender_.subscribe();};

    private:
        Sum_queue<Transfer_progress> queue_;

        Watch_sender<Transfer_rate> sender_;
};
