#pragma once
#include "io/writer_layer.hpp"
#include <boost/asio/write.hpp>

// Самый внутренний слой: любой поток с write_some из Boost.Asio
// (posix::stream_descriptor, tcp::socket ...). flush ничего не делает -
// у таких потоков нет своего буфера.
template<typename SyncWriteStream>
class Stream_sink : public Writer_layer<Stream_sink<SyncWriteStream>, SyncWriteStream>
{
    public:
        explicit Stream_sink(SyncWriteStream stream)
        : Writer_layer<Stream_sink<SyncWriteStream>, SyncWriteStream>(std::forward<SyncWriteStream>(stream))
        {}

        std::size_t write_chunk(boost::asio::const_buffer chunk, boost::system::error_code& ec)
        {
            return this->next_.write_some(chunk, ec);
        }

        void flush(boost::system::error_code& ec)
        {
            ec.clear();
        }
};
