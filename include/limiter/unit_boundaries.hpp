#pragma once
#include "config/transfer_config.hpp"
#include <cstddef>
#include <span>
#include <vector>

// Границы единиц в буфере: смещения байтов, после которых можно обрезать запись.
// Byte - каждый байт, Line - каждый '\n', Null - каждый '\0'.
class Unit_boundaries
{
    public:
        Unit_boundaries(std::span<const char> buffer, Unit unit);

        std::size_t count() const; // сколько токенов стоит весь буфер

        std::size_t offset(std::size_t index) const; // смещение index-й границы

        std::size_t prefix_end(std::size_t granted) const; // длина префикса до granted-й границы включительно

    private:
        std::size_t size_; // длина буфера

        Unit unit_;

        std::vector<std::size_t> delimiters_; // для Byte не заполняется
};
