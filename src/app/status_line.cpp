#include "app/status_line.hpp"
#include <array>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace
{
    constexpr double RELATIVE_TOLERANCE = 0.1;
    constexpr double ABSOLUTE_TOLERANCE = 1.0;

    std::string scaled(double value, double base, const std::array<const char*, 7>& prefixes)
    {
        if(!std::isfinite(value) || value < 0.0)
            value = 0.0;
        std::size_t index = 0;
        while(value >= base && index + 1 < prefixes.size())
        {
            value /= base;
            ++index;
        }
        char text[32];
        if(index == 0)
            std::snprintf(text, sizeof(text), "%.0f", value);
        else
            std::snprintf(text, sizeof(text), "%.2f%s", value, prefixes[index]);
        return text;
    }

    std::string format_count(double value, Unit unit)
    {
        if(unit == Unit::Byte)
            return format_binary(value) + unit_abbreviation(unit);
        return format_si(value) + unit_abbreviation(unit);
    }
}

std::string format_binary(double value)
{
    static const std::array<const char*, 7> prefixes{"", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei"};
    return scaled(value, 1024.0, prefixes);
}

std::string format_si(double value)
{
    static const std::array<const char*, 7> prefixes{"", "k", "M", "G", "T", "P", "E"};
    return scaled(value, 1000.0, prefixes);
}

std::string format_duration(std::chrono::steady_clock::duration duration)
{
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    if(secs < 0)
        secs = 0;
    char text[32];
    std::snprintf(text, sizeof(text), "%lld:%02lld:%02lld",
        static_cast<long long>(secs / 3600), static_cast<long long>((secs / 60) % 60), static_cast<long long>(secs % 60));
    return text;
}

bool rate_saturated(double rate, std::optional<std::uint32_t> limit)
{
    if(!limit)
        return false;
    double distance = std::abs(static_cast<double>(*limit) - rate);
    return rate >= *limit
        || distance <= ABSOLUTE_TOLERANCE
        || distance / *limit <= RELATIVE_TOLERANCE;
}

std::string format_status(const Status_view& view)
{
    const auto unit = view.config.unit;
    const auto& progress = view.cumulative.progress;
    std::ostringstream out;
    out << format_count(static_cast<double>(progress.count(unit)), unit);
    if(unit != Unit::Byte)
        out << " (" << format_count(static_cast<double>(progress.bytes_transferred), Unit::Byte) << ")";
    out << " " << format_duration(view.cumulative.elapsed());
    if(auto ratio = view.cumulative.ratio_of(view.config.expected_size))
        out << " " << static_cast<int>(*ratio * 100.0) << "%";

    double rate = view.rate.per_sec(unit);
    out << " [" << format_count(rate, unit) << "/s";
    if(rate_saturated(rate, view.config.limit()))
        out << "*";
    out << "]";

    if(auto limit = view.config.limit())
        out << " [limit " << *limit << unit_abbreviation(unit) << "/s]";
    else
        out << " [no limit]";
    if(view.paused)
        out << " [PAUSED]";
    return out.str();
}
