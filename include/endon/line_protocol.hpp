#pragma once
#include "types.hpp"
#include <string>

namespace endon {

// Кодирует точку в одну строку InfluxDB line protocol (без '\n' в конце),
// время в наносекундах. std::invalid_argument, если точку нельзя записать:
// пустой measurement, нет полей, NaN/Inf в поле.
std::string encode_line(const Point &point);

} // namespace endon
