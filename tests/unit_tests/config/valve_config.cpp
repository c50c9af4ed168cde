#include <gtest/gtest.h>
#include "config/valve_config.hpp"
#include <fstream>
#include <filesystem>

class ValveConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // очищаем тестовый конфиг файл если существует
        if(std::filesystem::exists(file_name))
        {
            std::filesystem::remove(file_name);
        }
    }

    void TearDown() override
    {
        // очищаем тестовый конфиг файл после теста
        if(std::filesystem::exists(file_name))
        {
            std::filesystem::remove(file_name);
        }
    }

    void write_config(const std::string& text)
    {
        std::ofstream file(file_name);
        file << text;
    }

    const std::string file_name = "pvalve_test.toml";
};

// файла нет - дефолтные настройки, файл не создается
TEST_F(ValveConfigTest, MissingFileKeepsDefaults)
{
    Valve_Config config(file_name);
    const auto& settings = config.get_settings();

    EXPECT_FALSE(std::filesystem::exists(file_name));
    EXPECT_EQ(settings.speed_limit, 0);
    EXPECT_EQ(settings.unit, "byte");
    EXPECT_EQ(settings.expected_size, 0);
    EXPECT_EQ(settings.window_milliseconds, 1000);
    EXPECT_EQ(settings.pause_poll_milliseconds, 500);
    EXPECT_EQ(settings.status_interval_milliseconds, 1000);
    EXPECT_EQ(settings.buffer_size, 64 * 1024);
    EXPECT_EQ(settings.log_on, false);
    EXPECT_EQ(settings.log_file_name, "pvalve.log");
    EXPECT_EQ(settings.log_file_size_bytes, 1024 * 1024 * 16);
    EXPECT_EQ(settings.debug, false);
}

// тест загрузки существующего конфига
TEST_F(ValveConfigTest, LoadExistingConfig)
{
    write_config(R"(
[valve]
speed_limit = 2048
unit = "line"
expected_size = 1000000
window_milliseconds = 3000
pause_poll_milliseconds = 100
status_interval_milliseconds = 250
buffer_size = 4096
log_on = true
log_file_name = "test.log"
log_file_size_bytes = 8388608
debug = true
)");

    Valve_Config config(file_name);
    const auto& settings = config.get_settings();

    EXPECT_EQ(settings.speed_limit, 2048);
    EXPECT_EQ(settings.unit, "line");
    EXPECT_EQ(settings.expected_size, 1000000);
    EXPECT_EQ(settings.window_milliseconds, 3000);
    EXPECT_EQ(settings.pause_poll_milliseconds, 100);
    EXPECT_EQ(settings.status_interval_milliseconds, 250);
    EXPECT_EQ(settings.buffer_size, 4096);
    EXPECT_EQ(settings.log_on, true);
    EXPECT_EQ(settings.log_file_name, "test.log");
    EXPECT_EQ(settings.log_file_size_bytes, 8388608);
    EXPECT_EQ(settings.debug, true);
}

// тест загрузки частичного конфига с дефолтными значениями
TEST_F(ValveConfigTest, LoadPartialConfigWithDefaults)
{
    write_config(R"(
[valve]
speed_limit = 100
)");

    Valve_Config config(file_name);
    const auto& settings = config.get_settings();

    EXPECT_EQ(settings.speed_limit, 100);
    EXPECT_EQ(settings.unit, "byte");
    EXPECT_EQ(settings.window_milliseconds, 1000);
    EXPECT_EQ(settings.log_file_name, "pvalve.log");
}

// тест обработки невалидного toml формата
TEST_F(ValveConfigTest, HandleInvalidTOMLFormat)
{
    write_config("[valve\nspeed_limit = abc");

    testing::internal::CaptureStderr();
    Valve_Config config(file_name);
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("TOML parsing error"), std::string::npos);
    EXPECT_NE(output.find("Using default settings"), std::string::npos);
    EXPECT_EQ(config.get_settings().speed_limit, 0);
}

// тест обработки невалидных значений в конфиге
TEST_F(ValveConfigTest, HandleInvalidConfigValues)
{
    write_config(R"(
[valve]
speed_limit = -5
unit = "furlong"
window_milliseconds = 0
buffer_size = 0
log_file_name = ""
)");

    testing::internal::CaptureStderr();
    Valve_Config config(file_name);
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("speed_limit"), std::string::npos);
    EXPECT_NE(output.find("unit must be one of"), std::string::npos);
    EXPECT_NE(output.find("are invalid"), std::string::npos);
    EXPECT_NE(output.find("Using default settings"), std::string::npos);

    const auto& settings = config.get_settings();
    EXPECT_EQ(settings.speed_limit, 0);
    EXPECT_EQ(settings.unit, "byte");
    EXPECT_EQ(settings.window_milliseconds, 1000);
    EXPECT_EQ(settings.buffer_size, 64 * 1024);
    EXPECT_FALSE(settings.log_file_name.empty());
}

// перечитывание подхватывает изменения файла
TEST_F(ValveConfigTest, ReloadPicksUpChanges)
{
    write_config("[valve]\nspeed_limit = 10\n");
    Valve_Config config(file_name);
    ASSERT_EQ(config.get_settings().speed_limit, 10);

    write_config("[valve]\nspeed_limit = 1000\nunit = \"null\"\n");
    EXPECT_TRUE(config.reload());
    EXPECT_EQ(config.get_settings().speed_limit, 1000);
    EXPECT_EQ(config.get_settings().unit, "null");
}

// неудачное перечитывание оставляет прежние настройки
TEST_F(ValveConfigTest, FailedReloadKeepsSettings)
{
    write_config("[valve]\nspeed_limit = 10\n");
    Valve_Config config(file_name);

    write_config("[valve]\nunit = \"parsec\"\n");
    testing::internal::CaptureStderr();
    EXPECT_FALSE(config.reload());
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(config.get_settings().speed_limit, 10);
    EXPECT_EQ(config.get_settings().unit, "byte");
}

// снимок для конвейера
TEST_F(ValveConfigTest, TransferConfigSnapshot)
{
    write_config("[valve]\nspeed_limit = 500\nunit = \"lines\"\nexpected_size = 4096\n");
    Valve_Config config(file_name);
    auto transfer = config.transfer_config();

    EXPECT_EQ(transfer.limit(), 500u);
    EXPECT_EQ(transfer.unit, Unit::Line);
    EXPECT_EQ(transfer.expected_size, 4096u);
}

// лимит 0 - без ограничения, размер 0 - неизвестен
TEST_F(ValveConfigTest, ZeroMeansUnset)
{
    Valve_Config config(file_name);
    auto transfer = config.transfer_config();

    EXPECT_FALSE(transfer.limit().has_value());
    EXPECT_FALSE(transfer.expected_size.has_value());
    EXPECT_EQ(transfer.unit, Unit::Byte);
}

// тест геттера настроек
TEST_F(ValveConfigTest, GetSettingsReturnsConstReference)
{
    const Valve_Config config(file_name);
    const auto& settings1 = config.get_settings();
    const auto& settings2 = config.get_settings();

    EXPECT_EQ(&settings1, &settings2);
}
