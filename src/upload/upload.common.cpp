#include "macros.hh"
#include "upload.common.hh"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

std::string
objupload::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
objupload::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

uint64_t
objupload::ceil_div(uint64_t dividend, uint64_t divisor)
{
    EXPECT(divisor > 0, "Division by zero.");

    return dividend / divisor + (dividend % divisor != 0 ? 1 : 0);
}

std::string
objupload::format_bytes(uint64_t nbytes)
{
    constexpr std::array<const char*, 5> units{ "B", "KiB", "MiB", "GiB",
                                                "TiB" };

    auto value = static_cast<double>(nbytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < units.size() - 1) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream ss;
    if (unit == 0) {
        ss << nbytes << " " << units[unit];
    } else {
        ss << std::fixed << std::setprecision(2) << value << " "
           << units[unit];
    }
    return ss.str();
}

std::chrono::milliseconds
objupload::retry_delay(uint32_t attempt)
{
    constexpr std::chrono::milliseconds base{ 100 };
    constexpr std::chrono::milliseconds max_delay{ 10'000 };

    if (attempt >= 7) {
        return max_delay;
    }
    return std::min(base * (1 << attempt), max_delay);
}
