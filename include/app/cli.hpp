#pragma once
#include "config/transfer_config.hpp"
#include "config/valve_config.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct Cli_options // то, что пришло из командной строки
{
    std::optional<std::uint32_t> rate_limit; // всегда > 0
    std::optional<Unit> unit;
    std::optional<std::uint64_t> expected_size;
    std::string config_file = "pvalve.toml";
    bool quiet = false; // не рисовать статус
    bool help = false;
};

// бросает boost::program_options::error при некорректных аргументах
Cli_options parse_command_line(int argc, const char* const argv[]);

std::string usage();

void apply_overrides(const Cli_options& options, Valve_Config::Valve_Settings& settings); // командная строка важнее файла
