#pragma once
#include "config/transfer_config.hpp"
#include <chrono>
#include <string>

class Valve_Config
{
    public:
        explicit Valve_Config(const std::string& filename = "pvalve.toml"); // конструктор

        struct Valve_Settings // настройки конфига
        {
            int64_t speed_limit = 0; // 0 - без ограничения
            std::string unit = "byte"; // byte, line или null
            int64_t expected_size = 0; // 0 - размер неизвестен
            // int64_t из за того что toml не хочет принимать std::size_t

            int64_t window_milliseconds = 1000; // окно мгновенной скорости
            int64_t pause_poll_milliseconds = 500;
            int64_t status_interval_milliseconds = 1000; // как часто перерисовывать статус
            int64_t buffer_size = 64 * 1024; // размер буфера копирования

            bool log_on = false;
            std::string log_file_name = "pvalve.log";
            int64_t log_file_size_bytes = 1024 * 1024 * 16; // 16 мб по дефолту
            bool debug = false; // писать в лог отладочные сообщения
        };
        
        const Valve_Settings& get_settings() const {return settings;}; // геттер для получение конфига

        Valve_Settings& get_settings() {return settings;}; // для перекрытия значений из командной строки

        bool reload(); // перечитать файл, false если файл некорректен (настройки не меняются)

        Transfer_config transfer_config() const; // начальный снимок для конвейера

        const std::string& file_name() const {return filename_;};

        static bool validate(const Valve_Settings& settings); // проверка корректности конфига

    private:
        Valve_Settings settings; // текущий конфиг

        std::string filename_; // откуда читаем

    private:
        void load_cfg(); // загрузка конфига, при ошибке - значения по умолчанию
};
