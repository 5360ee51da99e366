#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace recurrence {

// "YYYY-MM-DDTHH:MM:SSZ", optional fractional seconds. Anything other than UTC is rejected.
std::optional<std::time_t> parse_iso_z(const std::string& s);
std::string format_iso_z(std::time_t t);

}
