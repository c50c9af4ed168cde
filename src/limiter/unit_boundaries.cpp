#include "limiter/unit_boundaries.hpp"
#include <stdexcept>

Unit_boundaries::Unit_boundaries(std::span<const char> buffer, Unit unit)
: size_(buffer.size()), unit_(unit)
{
    if(unit_ == Unit::Byte)
        return;
    char delimiter = unit_ == Unit::Line ? LINE_DELIMITER : NULL_DELIMITER;
    for(std::size_t i = 0; i < buffer.size(); ++i)
    {
        if(buffer[i] == delimiter)
            delimiters_.push_back(i);
    }
}

std::size_t Unit_boundaries::count() const
{
    if(unit_ == Unit::Byte)
        return size_;
    return delimiters_.size();
}

std::size_t Unit_boundaries::offset(std::size_t index) const
{
    if(index >= count())
        throw std::out_of_range("unit boundary index out of range");
    if(unit_ == Unit::Byte)
        return index;
    return delimiters_[index];
}

std::size_t Unit_boundaries::prefix_end(std::size_t granted) const
{
    if(count() == 0) // меньше одной единицы - не измеряется, пропускаем целиком
        return size_;
    if(granted == 0)
        return 0;
    if(granted > count())
        granted = count();
    return offset(granted - 1) + 1; // вместе с разделителем
}
