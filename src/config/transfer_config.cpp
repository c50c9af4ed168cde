#include "config/transfer_config.hpp"
#include <limits>

Unit next_unit(Unit unit)
{
    switch(unit)
    {
        case Unit::Byte:
            return Unit::Line;
        case Unit::Line:
            return Unit::Null;
        case Unit::Null:
            return Unit::Byte;
    }
    return Unit::Byte;
}

const char* unit_name(Unit unit)
{
    switch(unit)
    {
        case Unit::Byte:
            return "byte";
        case Unit::Line:
            return "line";
        case Unit::Null:
            return "null";
    }
    return "byte";
}

const char* unit_abbreviation(Unit unit)
{
    switch(unit)
    {
        case Unit::Byte:
            return "B";
        case Unit::Line:
            return "L";
        case Unit::Null:
            return "#";
    }
    return "B";
}

std::optional<Unit> parse_unit(std::string_view name)
{
    if(name == "byte" || name == "bytes")
        return Unit::Byte;
    if(name == "line" || name == "lines")
        return Unit::Line;
    if(name == "null" || name == "nulls")
        return Unit::Null;
    return std::nullopt;
}

Speed_limit::Speed_limit()
: value_(1), enabled_(false)
{}

Speed_limit::Speed_limit(std::uint32_t limit)
: value_(limit == 0 ? 1 : limit), enabled_(limit != 0)
{}

std::optional<std::uint32_t> Speed_limit::limit() const
{
    if(enabled_)
        return value_;
    return std::nullopt;
}

bool Speed_limit::toggle()
{
    bool previous = enabled_;
    enabled_ = !enabled_;
    return previous;
}

void Speed_limit::set(std::uint32_t limit)
{
    if(limit == 0)
    {
        enabled_ = false;
        return;
    }
    value_ = limit;
    enabled_ = true;
}

Config_monitor::Config_monitor(Watch_receiver<Transfer_config> receiver)
: receiver_(std::move(receiver))
{}

Transfer_config Config_monitor::get() const
{
    return receiver_.get();
}

std::optional<Transfer_config> Config_monitor::get_if_new()
{
    return receiver_.get_if_new();
}

std::optional<std::uint32_t> Config_monitor::limit() const
{
    return receiver_.get().limit();
}

Unit Config_monitor::unit() const
{
    return receiver_.get().unit;
}

Config_control::Config_control(Transfer_config initial)
: current_(initial), sender_(initial)
{}

void Config_control::send(Transfer_config config)
{
    current_ = config;
    sender_.send(current_);
}

void Config_control::set_limit(std::uint32_t limit)
{
    auto config = current_;
    config.speed_limit.set(limit);
    send(config);
}

void Config_control::increase_limit(std::uint32_t step)
{
    auto value = current_.speed_limit.value();
    if(value > std::numeric_limits<std::uint32_t>::max() - step) // переполнение - оставляем как есть
        return;
    set_limit(value + step);
}

void Config_control::decrease_limit(std::uint32_t step)
{
    auto value = current_.speed_limit.value();
    if(value <= step) // до нуля не опускаемся
        return;
    set_limit(value - step);
}

bool Config_control::toggle_limit()
{
    auto config = current_;
    bool previous = config.toggle_limit();
    send(config);
    return previous;
}

void Config_control::set_unit(Unit unit)
{
    auto config = current_;
    config.unit = unit;
    send(config);
}

Unit Config_control::cycle_unit()
{
    auto config = current_;
    config.unit = next_unit(config.unit);
    send(config);
    return config.unit;
}

Config_monitor Config_control::monitor() const
{
    return Config_monitor(sender_.subscribe());
}
