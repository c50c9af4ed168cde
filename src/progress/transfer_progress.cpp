#include "progress/transfer_progress.hpp"
#include <algorithm>

Transfer_progress Transfer_progress::measure(std::span<const char> data)
{
    Transfer_progress result;
    result.bytes_transferred = data.size();
    for(char byte : data)
    {
        if(byte == LINE_DELIMITER)
            ++result.lines_transferred;
        else if(byte == NULL_DELIMITER)
            ++result.nulls_transferred;
    }
    return result;
}

std::uint64_t Transfer_progress::count(Unit unit) const
{
    switch(unit)
    {
        case Unit::Byte:
            return bytes_transferred;
        case Unit::Line:
            return lines_transferred;
        case Unit::Null:
            return nulls_transferred;
    }
    return bytes_transferred;
}

Transfer_progress& Transfer_progress::operator+=(const Transfer_progress& other)
{
    bytes_transferred += other.bytes_transferred;
    lines_transferred += other.lines_transferred;
    nulls_transferred += other.nulls_transferred;
    return *this;
}

Transfer_progress operator+(Transfer_progress lhs, const Transfer_progress& rhs)
{
    lhs += rhs;
    return lhs;
}

std::chrono::steady_clock::duration Cumulative_progress::elapsed() const
{
    return std::chrono::steady_clock::now() - start_time;
}

std::optional<double> Cumulative_progress::ratio_of(std::optional<std::uint64_t> expected_size) const
{
    if(!expected_size || *expected_size == 0)
        return std::nullopt;
    double ratio = static_cast<double>(progress.bytes_transferred) / static_cast<double>(*expected_size);
    return std::min(1.0, ratio);
}

double Transfer_rate::per_sec(Unit unit) const
{
    switch(unit)
    {
        case Unit::Byte:
            return bytes_per_sec;
        case Unit::Line:
            return lines_per_sec;
        case Unit::Null:
            return nulls_per_sec;
    }
    return bytes_per_sec;
}

bool Transfer_rate::expired(std::chrono::steady_clock::duration window, std::chrono::steady_clock::time_point now) const
{
    return now - measured_at >= window;
}

Transfer_rate windowed_mean(const std::optional<Transfer_progress>& sum, std::chrono::steady_clock::duration window)
{
    Transfer_rate rate;
    auto seconds = std::chrono::duration<double>(window).count();
    if(!sum || seconds <= 0.0)
        return rate;
    rate.bytes_per_sec = sum->bytes_transferred / seconds;
    rate.lines_per_sec = sum->lines_transferred / seconds;
    rate.nulls_per_sec = sum->nulls_transferred / seconds;
    return rate;
}
