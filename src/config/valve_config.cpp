#include "config/valve_config.hpp"
#include <toml++/toml.hpp>
#include <filesystem>
#include <iostream>
#include <limits>

namespace
{
    // сообщения только в stderr: stdout занят данными
    bool read_settings(const std::string& filename, Valve_Config::Valve_Settings& settings)
    {
        auto config = toml::parse_file(filename);
        if(config["valve"])
        {
            auto valve = config["valve"];
            settings.speed_limit = valve["speed_limit"].value_or(settings.speed_limit);
            settings.unit = valve["unit"].value_or(settings.unit);
            settings.expected_size = valve["expected_size"].value_or(settings.expected_size);
            settings.window_milliseconds = valve["window_milliseconds"].value_or(settings.window_milliseconds);
            settings.pause_poll_milliseconds = valve["pause_poll_milliseconds"].value_or(settings.pause_poll_milliseconds);
            settings.status_interval_milliseconds = valve["status_interval_milliseconds"].value_or(settings.status_interval_milliseconds);
            settings.buffer_size = valve["buffer_size"].value_or(settings.buffer_size);
            settings.log_on = valve["log_on"].value_or(settings.log_on);
            settings.log_file_name = valve["log_file_name"].value_or(settings.log_file_name);
            settings.log_file_size_bytes = valve["log_file_size_bytes"].value_or(settings.log_file_size_bytes);
            settings.debug = valve["debug"].value_or(settings.debug);
        }
        return Valve_Config::validate(settings);
    }
}

Valve_Config::Valve_Config(const std::string& filename)
: filename_(filename)
{
    load_cfg();
}

bool Valve_Config::validate(const Valve_Settings& settings)
{
    bool error_flag = false;
    if(settings.speed_limit < 0 || settings.speed_limit > std::numeric_limits<std::uint32_t>::max())
    {
        std::cerr << "Error in config: speed_limit must be in range 0-4294967295" << std::endl;
        error_flag = true;
    }
    if(!parse_unit(settings.unit))
    {
        std::cerr << "Error in config: unit must be one of byte, line, null" << std::endl;
        error_flag = true;
    }
    if(settings.expected_size < 0)
    {
        std::cerr << "Error in config: expected_size cannot be negative" << std::endl;
        error_flag = true;
    }
    if(settings.window_milliseconds <= 0 || settings.window_milliseconds > 600000)
    {
        std::cerr << "Error in config: window_milliseconds must be in range 1-600000" << std::endl;
        error_flag = true;
    }
    if(settings.pause_poll_milliseconds <= 0 || settings.pause_poll_milliseconds > 60000)
    {
        std::cerr << "Error in config: pause_poll_milliseconds must be in range 1-60000" << std::endl;
        error_flag = true;
    }
    if(settings.status_interval_milliseconds <= 0 || settings.status_interval_milliseconds > 600000)
    {
        std::cerr << "Error in config: status_interval_milliseconds must be in range 1-600000" << std::endl;
        error_flag = true;
    }
    if(settings.buffer_size < 1 || settings.buffer_size > 64 * 1024 * 1024)
    {
        std::cerr << "Error in config: buffer_size must be in range 1-67108864" << std::endl;
        error_flag = true;
    }
    if(settings.log_file_name.empty())
    {
        std::cerr << "Error in config: log_file_name cannot be empty" << std::endl;
        error_flag = true;
    }
    if(settings.log_file_size_bytes < 1)
    {
        std::cerr << "Error in config: log_file_size_bytes must be greater than 0" << std::endl;
        error_flag = true;
    }
    return !error_flag;
}

void Valve_Config::load_cfg()
{
    if(!std::filesystem::exists(filename_))
        return; // файла нет - работаем на значениях по умолчанию
    if(!reload())
    {
        std::cerr << "Using default settings" << std::endl;
        settings = Valve_Settings{};
    }
}

bool Valve_Config::reload()
{
    try
    {
        Valve_Settings loaded = settings;
        if(!read_settings(filename_, loaded))
        {
            std::cerr << "Loaded settings from " << filename_ << " are invalid" << std::endl;
            return false;
        }
        settings = loaded;
        return true;
    }
    catch(const toml::parse_error& err)
    {
        std::cerr << "TOML parsing error: " << err.what() << std::endl;
    }
    catch(const std::exception& ex)
    {
        std::cerr << "Error working with configuration: " << ex.what() << std::endl;
    }
    return false;
}

Transfer_config Valve_Config::transfer_config() const
{
    Transfer_config config;
    config.speed_limit = Speed_limit(static_cast<std::uint32_t>(settings.speed_limit));
    config.unit = parse_unit(settings.unit).value_or(Unit::Byte);
    if(settings.expected_size > 0)
        config.expected_size = static_cast<std::uint64_t>(settings.expected_size);
    return config;
}
