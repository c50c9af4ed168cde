#pragma once
#include "io/writer_layer.hpp"
#include "progress/transfer_progress.hpp"

// Считает только то, что внутренний слой действительно принял.
template<typename NextLayer>
class Progress_writer : public Writer_layer<Progress_writer<NextLayer>, NextLayer>
{
    public:
        explicit Progress_writer(NextLayer next)
        : Writer_layer<Progress_writer<NextLayer>, NextLayer>(std::forward<NextLayer>(next)),
          cumulative_(), sender_(cumulative_)
        {}

        std::size_t write_chunk(boost::asio::const_buffer chunk, boost::system::error_code& ec)
        {
            auto written = this->next_.write_some(chunk, ec);
            if(written > 0)
            {
                cumulative_.progress += Transfer_progress::measure(this->as_span(chunk).first(written));
                sender_.send(cumulative_);
            }
            return written;
        }

        Progress_monitor progress() const {return sender_.subscribe();};

    private:
        Cumulative_progress cumulative_; // время старта фиксируется при создании

        Watch_sender<Cumulative_progress> sender_;
};
