#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/core.hpp>

class Logger
{
    public:
        enum LOG_LEVEL{INFO, DEBUG, WARNING, ERROR};

        Logger() = default;

        explicit Logger(LOG_LEVEL log_level) : log_level_(log_level) {}

        template<typename T>
        Logger& operator<<(const T& data)
        {
            buffer() << data;
            return *this;
        }
        Logger& operator<<(std::ostream& (*func)(std::ostream&))
        { // std::endl завершает запись, остальные манипуляторы уходят в буфер
            if(func == static_cast<std::ostream&(*)(std::ostream&)>(std::endl))
                flush();
            else
                buffer() << func;
            return *this;
        }

        void set_level(LOG_LEVEL log_level);

        void init_logger(const std::string& log_file, std::size_t rotation_size);

        static void set_debug_enabled(bool enabled); // пропускать ли записи уровня debug (общий фильтр Boost.Log)
    
    private:

        void flush();

        std::ostringstream& buffer(); // у каждого потока свой буфер, записи не перемешиваются

    private:
        LOG_LEVEL log_level_ = LOG_LEVEL::INFO;
};
