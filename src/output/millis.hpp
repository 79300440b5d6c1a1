#pragma once

#include <format>
#include <string>

// Seconds to a millisecond string that always carries a fractional part
// ("10.0", "7.5"), the form the typing helpers are driven with.
inline std::string format_millis(double seconds) {
    auto s = std::format("{}", seconds * 1000.0);
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
}
