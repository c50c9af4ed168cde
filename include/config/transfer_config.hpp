#pragma once
#include "sync/watch.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class Unit // в чем измеряется и ограничивается скорость
{
    Byte, // байты
    Line, // строки, разделенные '\n'
    Null // записи, разделенные '\0'
};

constexpr char LINE_DELIMITER = 0x0A;
constexpr char NULL_DELIMITER = 0x00;

Unit next_unit(Unit unit); // Byte -> Line -> Null -> Byte

const char* unit_name(Unit unit); // "byte", "line", "null"

const char* unit_abbreviation(Unit unit); // "B", "L", "#"

std::optional<Unit> parse_unit(std::string_view name);

class Speed_limit // ограничение скорости, которое можно выключить не теряя значения
{
    public:
        Speed_limit(); // выключено, значение 1

        explicit Speed_limit(std::uint32_t limit); // 0 значит "выключено"

        std::optional<std::uint32_t> limit() const; // значение, если включено

        std::uint32_t value() const {return value_;};

        bool enabled() const {return enabled_;};

        bool toggle(); // возвращает предыдущее состояние

        void set(std::uint32_t limit); // 0 выключает, значение сохраняется

        bool operator==(const Speed_limit&) const = default;

    private:
        std::uint32_t value_; // всегда > 0

        bool enabled_;
};

struct Transfer_config // снимок настроек, меняется только целиком
{
    Speed_limit speed_limit;
    Unit unit = Unit::Byte;
    std::optional<std::uint64_t> expected_size; // для процентов

    std::optional<std::uint32_t> limit() const {return speed_limit.limit();};

    bool toggle_limit() {return speed_limit.toggle();};

    bool operator==(const Transfer_config&) const = default;
};

class Config_monitor // сторона чтения снимков конфигурации
{
    public:
        explicit Config_monitor(Watch_receiver<Transfer_config> receiver);

        Transfer_config get() const;

        std::optional<Transfer_config> get_if_new(); // снимок, которого этот монитор еще не видел

        std::optional<std::uint32_t> limit() const;

        Unit unit() const;

    private:
        Watch_receiver<Transfer_config> receiver_;
};

class Config_control // единственный владелец отправителя конфигурации
{
    public:
        explicit Config_control(Transfer_config initial);

        Config_control(const Config_control&) = delete;
        Config_control& operator=(const Config_control&) = delete;
        Config_control(Config_control&&) = default;
        Config_control& operator=(Config_control&&) = default;

        const Transfer_config& current() const {return current_;};

        void send(Transfer_config config); // заменяет снимок целиком

        void set_limit(std::uint32_t limit);

        void increase_limit(std::uint32_t step); // с насыщением, без переполнения

        void decrease_limit(std::uint32_t step); // никогда не опускается до 0

        bool toggle_limit();

        void set_unit(Unit unit);

        Unit cycle_unit();

        Config_monitor monitor() const;

    private:
        Transfer_config current_;

        Watch_sender<Transfer_config> sender_;
};
