#pragma once
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

// приемник в памяти: копит байты, умеет брать не больше max_per_write и отдавать ошибку
struct Memory_sink
{
    std::string data;
    std::vector<std::size_t> writes; // размеры каждой записи
    std::size_t max_per_write = std::numeric_limits<std::size_t>::max();
    boost::system::error_code fail_with; // если задано - каждая запись падает
    std::size_t flushes = 0;

    template<typename ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers, boost::system::error_code& ec)
    {
        ec.clear();
        if(fail_with)
        {
            ec = fail_with;
            return 0;
        }
        std::string chunk(boost::asio::buffer_size(buffers), '\0');
        boost::asio::buffer_copy(boost::asio::buffer(chunk), buffers);
        chunk.resize(std::min(chunk.size(), max_per_write));
        data += chunk;
        writes.push_back(chunk.size());
        return chunk.size();
    }

    void flush(boost::system::error_code& ec)
    {
        ec.clear();
        ++flushes;
    }
};

// источник в памяти: отдает куски по chunk_size, потом eof
struct Memory_source
{
    std::string data;
    std::size_t chunk_size = 4096;
    std::size_t position = 0;
    boost::system::error_code fail_with;

    template<typename MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers, boost::system::error_code& ec)
    {
        ec.clear();
        if(fail_with)
        {
            ec = fail_with;
            return 0;
        }
        if(position >= data.size())
        {
            ec = boost::asio::error::eof;
            return 0;
        }
        auto count = std::min(chunk_size, data.size() - position);
        auto copied = boost::asio::buffer_copy(buffers, boost::asio::buffer(data.data() + position, count));
        position += copied;
        return copied;
    }
};
