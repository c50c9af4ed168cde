#include "logger/logger.hpp"
#include <boost/log/expressions.hpp>
#include <unordered_map>

void Logger::set_level(LOG_LEVEL level)
{
    log_level_ = level;
}

void Logger::init_logger(const std::string& log_file, std::size_t rotation_size)
{
    boost::log::add_file_log
    (
        boost::log::keywords::file_name = log_file,
        boost::log::keywords::rotation_size = rotation_size,
        boost::log::keywords::auto_flush = true,
        boost::log::keywords::format = "[%TimeStamp%] [%Severity%] %Message%"
    );
    boost::log::add_common_attributes();
}

void Logger::set_debug_enabled(bool enabled)
{
    auto min_severity = enabled ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_severity);
}

std::ostringstream& Logger::buffer()
{
    thread_local std::unordered_map<const Logger*, std::ostringstream> buffers;
    return buffers[this];
}

void Logger::flush()
{
    auto& stream = buffer();
    switch(log_level_)
    {
        case LOG_LEVEL::INFO:
            BOOST_LOG_TRIVIAL(info) << stream.str();
            break;
        case LOG_LEVEL::DEBUG:
            BOOST_LOG_TRIVIAL(debug) << stream.str();
            break;
        case LOG_LEVEL::WARNING:
            BOOST_LOG_TRIVIAL(warning) << stream.str();
            break;
        case LOG_LEVEL::ERROR:
            BOOST_LOG_TRIVIAL(error) << stream.str();
            break;
    }
    stream.str(""); // очистка
    stream.clear();
}
