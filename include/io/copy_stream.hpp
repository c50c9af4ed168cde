#pragma once
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <vector>

struct Copy_result
{
    std::uint64_t bytes_copied = 0; // сколько байт принял writer
    boost::system::error_code error; // eof сюда не попадает
};

// Цикл потока передачи: read_some из source, boost::asio::write в writer
// (он сам досылает остаток после короткой записи), flush в конце.
// Ошибки не повторяются: первая ошибка чтения или записи завершает цикл.
template<typename SyncReadStream, typename Writer>
Copy_result copy_stream(SyncReadStream& source, Writer& writer, std::size_t buffer_size = 64 * 1024)
{
    Copy_result result;
    std::vector<char> buffer(buffer_size == 0 ? 1 : buffer_size);
    for(;;)
    {
        boost::system::error_code ec;
        auto bytes_read = source.read_some(boost::asio::buffer(buffer), ec);
        if(ec == boost::asio::error::eof)
            break;
        if(ec)
        {
            result.error = ec;
            return result;
        }
        auto bytes_written = boost::asio::write(writer, boost::asio::buffer(buffer.data(), bytes_read), ec);
        result.bytes_copied += bytes_written;
        if(ec)
        {
            result.error = ec;
            return result;
        }
    }
    writer.flush(result.error);
    return result;
}
