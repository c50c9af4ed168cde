#pragma once
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>

// Общая часть всех слоев конвейера: интерфейс SyncWriteStream поверх write_chunk.
// Derived реализует
//     std::size_t write_chunk(boost::asio::const_buffer chunk, boost::system::error_code& ec);
// Слой пишет только первый непустой буфер последовательности: короткая запись
// законна, остаток повторит вызывающий (например boost::asio::write).
template<typename Derived, typename NextLayer>
class Writer_layer
{
    public:
        using next_layer_type = std::remove_reference_t<NextLayer>;

        explicit Writer_layer(NextLayer next)
        : next_(std::forward<NextLayer>(next))
        {}

        next_layer_type& next_layer() {return next_;};

        const next_layer_type& next_layer() const {return next_;};

        template<typename ConstBufferSequence>
        std::size_t write_some(const ConstBufferSequence& buffers, boost::system::error_code& ec)
        {
            ec.clear();
            auto chunk = first_chunk(buffers);
            if(chunk.size() == 0)
                return 0;
            return static_cast<Derived*>(this)->write_chunk(chunk, ec);
        }

        template<typename ConstBufferSequence>
        std::size_t write_some(const ConstBufferSequence& buffers)
        {
            boost::system::error_code ec;
            auto written = write_some(buffers, ec);
            if(ec)
                throw boost::system::system_error(ec, "write_some");
            return written;
        }

        void flush(boost::system::error_code& ec)
        {
            next_.flush(ec);
        }

    protected:
        template<typename ConstBufferSequence>
        static boost::asio::const_buffer first_chunk(const ConstBufferSequence& buffers)
        {
            auto end = boost::asio::buffer_sequence_end(buffers);
            for(auto it = boost::asio::buffer_sequence_begin(buffers); it != end; ++it)
            {
                boost::asio::const_buffer chunk(*it);
                if(chunk.size() > 0)
                    return chunk;
            }
            return boost::asio::const_buffer();
        }

        static std::span<const char> as_span(boost::asio::const_buffer chunk)
        {
            return {static_cast<const char*>(chunk.data()), chunk.size()};
        }

    protected:
        NextLayer next_; // следующий (внутренний) слой
};
