#pragma once
#include "io/writer_layer.hpp"
#include "sync/latch.hpp"
#include "globals/globals.hpp"
#include <boost/asio/error.hpp>

// После отмены каждая запись завершается broken_pipe и ничего не пропускает,
// даже если флаг потом выключат.
template<typename NextLayer>
class Cancellable_writer : public Writer_layer<Cancellable_writer<NextLayer>, NextLayer>
{
    public:
        Cancellable_writer(NextLayer next, Latch_monitor aborted)
        : Writer_layer<Cancellable_writer<NextLayer>, NextLayer>(std::forward<NextLayer>(next)),
          aborted_(std::move(aborted)), cancelled_(false)
        {}

        std::size_t write_chunk(boost::asio::const_buffer chunk, boost::system::error_code& ec)
        {
            if(!cancelled_ && aborted_.active())
            {
                cancelled_ = true;
                if(__PVALVE_GLOBALS__::LOG_ON)
                    __PVALVE_GLOBALS__::LOGGER << "Transfer cancelled" << std::endl;
            }
            if(cancelled_)
            {
                ec = boost::asio::error::broken_pipe;
                return 0;
            }
            return this->next_.write_some(chunk, ec);
        }

        bool cancelled() const {return cancelled_;};

    private:
        Latch_monitor aborted_;

        bool cancelled_; // отмена навсегда
};
